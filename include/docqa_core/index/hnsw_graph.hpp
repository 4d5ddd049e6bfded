#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace docqa_core {

/**
 * @class HnswGraph
 * @brief Hierarchical navigable small world graph over unit vectors.
 *
 * Nodes are dense slot numbers (0, 1, 2, ...) added in order; the vectors live
 * with the owner and are reached through a lookup callback. Similarity is the
 * dot product, so vectors must already be L2-normalized.
 *
 * Layer assignment is drawn from a generator seeded by the node's insertion
 * sequence, so rebuilding the graph from the same entries reproduces it.
 *
 * Not thread-safe; the owning index serializes access.
 */
class HnswGraph {
 public:
  using VectorLookup = std::function<const float *(uint32_t slot)>;

  // Hard cap on the number of layers.
  static constexpr int kMaxLevel = 16;

  HnswGraph(size_t dimension, int m, int ef_construction, VectorLookup lookup);

  // Adds the next slot (must equal size()) with the given insertion sequence.
  void add(uint32_t slot, uint64_t sequence);

  // Up to k (slot, score) pairs, best first. ef is the layer-0 beam width and is
  // raised to k when smaller.
  std::vector<std::pair<uint32_t, float>> search(const float *query, size_t k, size_t ef) const;

  void clear();

  size_t size() const {
    return nodes_.size();
  }

  int max_level() const {
    return max_level_;
  }

  // Level for a given insertion sequence, floor(-ln(U) / ln(M)) capped at kMaxLevel.
  static int draw_level(uint64_t sequence, int m);

 private:
  struct Node {
    int level = 0;
    std::vector<std::vector<uint32_t>> links;  // links[layer]
  };

  float similarity(const float *query, uint32_t slot) const;

  uint32_t greedy_closest(const float *query, uint32_t entry, int layer) const;

  std::vector<std::pair<uint32_t, float>> search_layer(const float *query,
                                                       uint32_t entry,
                                                       size_t ef,
                                                       int layer) const;

  void connect(uint32_t slot, std::vector<std::pair<uint32_t, float>> candidates, int layer);

  void prune_links(uint32_t slot, int layer);

  size_t max_links(int layer) const {
    return layer == 0 ? static_cast<size_t>(2 * m_) : static_cast<size_t>(m_);
  }

  size_t dimension_;
  int m_;
  int ef_construction_;
  VectorLookup lookup_;

  std::vector<Node> nodes_;
  uint32_t entry_point_ = 0;
  int max_level_ = -1;
};

}  // namespace docqa_core
