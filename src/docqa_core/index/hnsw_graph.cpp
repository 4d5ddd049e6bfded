#include "docqa_core/index/hnsw_graph.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>
#include <random>
#include <stdexcept>
#include <unordered_set>

namespace docqa_core {

namespace {

using ScoredSlot = std::pair<uint32_t, float>;

// Best first: higher score, then lower slot (earlier insertion).
bool better(const ScoredSlot &a, const ScoredSlot &b) {
  if (a.second != b.second) {
    return a.second > b.second;
  }
  return a.first < b.first;
}

struct WorseOnTop {
  bool operator()(const ScoredSlot &a, const ScoredSlot &b) const {
    return better(a, b);
  }
};

struct BetterOnTop {
  bool operator()(const ScoredSlot &a, const ScoredSlot &b) const {
    return better(b, a);
  }
};

}  // namespace

HnswGraph::HnswGraph(size_t dimension, int m, int ef_construction, VectorLookup lookup)
    : dimension_(dimension), m_(m), ef_construction_(ef_construction), lookup_(std::move(lookup)) {
  if (m_ < 2) {
    throw std::invalid_argument("HnswGraph: M must be at least 2");
  }
  if (ef_construction_ < 1) {
    throw std::invalid_argument("HnswGraph: ef_construction must be positive");
  }
  if (!lookup_) {
    throw std::invalid_argument("HnswGraph: vector lookup is required");
  }
}

int HnswGraph::draw_level(uint64_t sequence, int m) {
  std::mt19937_64 rng(0x5DEECE66DULL ^ (sequence * 0x9E3779B97F4A7C15ULL));
  std::uniform_real_distribution<double> dist(std::numeric_limits<double>::min(), 1.0);
  const double ml = 1.0 / std::log(static_cast<double>(m));
  const int level = static_cast<int>(std::floor(-std::log(dist(rng)) * ml));
  return std::min(level, kMaxLevel);
}

float HnswGraph::similarity(const float *query, uint32_t slot) const {
  const float *v = lookup_(slot);
  float dot = 0.0f;
  for (size_t i = 0; i < dimension_; ++i) {
    dot += query[i] * v[i];
  }
  return dot;
}

void HnswGraph::add(uint32_t slot, uint64_t sequence) {
  if (slot != nodes_.size()) {
    throw std::logic_error("HnswGraph: slots must be added in order");
  }

  const int level = draw_level(sequence, m_);
  Node node;
  node.level = level;
  node.links.resize(static_cast<size_t>(level) + 1);
  nodes_.push_back(std::move(node));

  if (max_level_ < 0) {
    entry_point_ = slot;
    max_level_ = level;
    return;
  }

  const float *query = lookup_(slot);
  uint32_t current = entry_point_;
  for (int layer = max_level_; layer > level; --layer) {
    current = greedy_closest(query, current, layer);
  }

  for (int layer = std::min(level, max_level_); layer >= 0; --layer) {
    auto candidates = search_layer(query, current, static_cast<size_t>(ef_construction_), layer);
    current = candidates.front().first;
    connect(slot, std::move(candidates), layer);
  }

  if (level > max_level_) {
    max_level_ = level;
    entry_point_ = slot;
  }
}

uint32_t HnswGraph::greedy_closest(const float *query, uint32_t entry, int layer) const {
  uint32_t current = entry;
  float current_score = similarity(query, current);
  bool improved = true;
  while (improved) {
    improved = false;
    for (uint32_t neighbor : nodes_[current].links[layer]) {
      const float score = similarity(query, neighbor);
      if (better({neighbor, score}, {current, current_score})) {
        current = neighbor;
        current_score = score;
        improved = true;
      }
    }
  }
  return current;
}

std::vector<ScoredSlot> HnswGraph::search_layer(const float *query,
                                                uint32_t entry,
                                                size_t ef,
                                                int layer) const {
  std::unordered_set<uint32_t> visited{entry};
  std::priority_queue<ScoredSlot, std::vector<ScoredSlot>, BetterOnTop> candidates;
  std::priority_queue<ScoredSlot, std::vector<ScoredSlot>, WorseOnTop> found;

  const ScoredSlot start{entry, similarity(query, entry)};
  candidates.push(start);
  found.push(start);

  while (!candidates.empty()) {
    const ScoredSlot closest = candidates.top();
    candidates.pop();
    if (found.size() >= ef && better(found.top(), closest)) {
      break;
    }
    for (uint32_t neighbor : nodes_[closest.first].links[layer]) {
      if (!visited.insert(neighbor).second) {
        continue;
      }
      const ScoredSlot scored{neighbor, similarity(query, neighbor)};
      if (found.size() < ef || better(scored, found.top())) {
        candidates.push(scored);
        found.push(scored);
        if (found.size() > ef) {
          found.pop();
        }
      }
    }
  }

  std::vector<ScoredSlot> result;
  result.reserve(found.size());
  while (!found.empty()) {
    result.push_back(found.top());
    found.pop();
  }
  std::reverse(result.begin(), result.end());
  return result;
}

void HnswGraph::connect(uint32_t slot, std::vector<ScoredSlot> candidates, int layer) {
  const size_t limit = max_links(layer);
  if (candidates.size() > limit) {
    candidates.resize(limit);
  }
  auto &own_links = nodes_[slot].links[layer];
  for (const auto &[neighbor, score] : candidates) {
    own_links.push_back(neighbor);
    auto &their_links = nodes_[neighbor].links[layer];
    their_links.push_back(slot);
    if (their_links.size() > limit) {
      prune_links(neighbor, layer);
    }
  }
}

void HnswGraph::prune_links(uint32_t slot, int layer) {
  const float *base = lookup_(slot);
  auto &links = nodes_[slot].links[layer];
  std::vector<ScoredSlot> scored;
  scored.reserve(links.size());
  for (uint32_t neighbor : links) {
    scored.emplace_back(neighbor, similarity(base, neighbor));
  }
  std::sort(scored.begin(), scored.end(), better);
  scored.resize(max_links(layer));
  links.clear();
  for (const auto &entry : scored) {
    links.push_back(entry.first);
  }
}

std::vector<ScoredSlot> HnswGraph::search(const float *query, size_t k, size_t ef) const {
  if (nodes_.empty() || k == 0) {
    return {};
  }
  uint32_t current = entry_point_;
  for (int layer = max_level_; layer > 0; --layer) {
    current = greedy_closest(query, current, layer);
  }
  auto result = search_layer(query, current, std::max(ef, k), 0);
  if (result.size() > k) {
    result.resize(k);
  }
  return result;
}

void HnswGraph::clear() {
  nodes_.clear();
  entry_point_ = 0;
  max_level_ = -1;
}

}  // namespace docqa_core
