#include "docqa_core/index/vector_index.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <unordered_set>

#include "docqa_core/errors.hpp"
#include "docqa_core/hashing.hpp"
#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

namespace {

constexpr char kMagic[4] = {'D', 'Q', 'V', 'I'};
constexpr uint32_t kFormatVersion = 1;
constexpr size_t kHeaderSize = 4 + 4 + 4 + 8 + 8;
constexpr size_t kChecksumSize = 32;

void put_u32(std::string &out, uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
  }
}

void put_u64(std::string &out, uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
  }
}

void put_f32(std::string &out, float value) {
  uint32_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  put_u32(out, bits);
}

// Bounds-checked little-endian reader over the file image.
class Reader {
 public:
  Reader(const std::string &bytes, size_t limit, const std::filesystem::path &path)
      : bytes_(bytes), limit_(limit), path_(path) {}

  uint32_t u32() {
    require(4);
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
      value |= static_cast<uint32_t>(static_cast<unsigned char>(bytes_[pos_ + i])) << (8 * i);
    }
    pos_ += 4;
    return value;
  }

  uint64_t u64() {
    require(8);
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
      value |= static_cast<uint64_t>(static_cast<unsigned char>(bytes_[pos_ + i])) << (8 * i);
    }
    pos_ += 8;
    return value;
  }

  float f32() {
    const uint32_t bits = u32();
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
  }

  std::string string(size_t length) {
    require(length);
    std::string value = bytes_.substr(pos_, length);
    pos_ += length;
    return value;
  }

  size_t remaining() const {
    return limit_ - pos_;
  }

 private:
  void require(size_t count) {
    if (count > limit_ - pos_) {
      throw IndexLoadError("load", path_.string() + ": truncated index file");
    }
  }

  const std::string &bytes_;
  size_t limit_;
  const std::filesystem::path &path_;
  size_t pos_ = 0;
};

bool ranks_before(const IndexSearchResult &a, uint64_t seq_a,
                  const IndexSearchResult &b, uint64_t seq_b) {
  if (a.score != b.score) {
    return a.score > b.score;
  }
  return seq_a < seq_b;
}

}  // namespace

IndexOptions IndexOptions::from_config(const RetrievalConfig &config, size_t dimension) {
  IndexOptions options;
  options.dimension = dimension;
  options.approximate_threshold = static_cast<size_t>(config.approximate_index_threshold);
  options.search_width = static_cast<size_t>(config.search_width);
  options.hnsw_m = config.hnsw_m;
  options.hnsw_ef_construction = config.hnsw_ef_construction;
  return options;
}

VectorIndex::VectorIndex(IndexOptions options) : options_(options) {
  if (options_.approximate_threshold == 0) {
    throw ConfigError("VectorIndex", "approximate_threshold must be positive");
  }
  if (options_.search_width == 0) {
    throw ConfigError("VectorIndex", "search_width must be positive");
  }
  if (options_.hnsw_m < 2 || options_.hnsw_ef_construction < 1) {
    throw ConfigError("VectorIndex", "invalid graph parameters");
  }
  state_.dimension = options_.dimension;
}

std::vector<float> VectorIndex::prepare_vector(const std::string &operation,
                                               const std::string &chunk_id,
                                               const std::vector<float> &vector,
                                               size_t dimension) const {
  if (vector.size() != dimension) {
    throw DimensionMismatchError(operation, chunk_id + ": expected dimension " +
                                                std::to_string(dimension) + ", got " +
                                                std::to_string(vector.size()));
  }
  double norm = 0.0;
  for (float value : vector) {
    norm += static_cast<double>(value) * value;
  }
  norm = std::sqrt(norm);
  if (!(norm > 0.0) || !std::isfinite(norm)) {
    throw InvalidArgumentError(operation, chunk_id + ": vector has no direction");
  }
  std::vector<float> unit(vector.size());
  for (size_t i = 0; i < vector.size(); ++i) {
    unit[i] = static_cast<float>(vector[i] / norm);
  }
  return unit;
}

void VectorIndex::insert(const std::string &chunk_id, const std::vector<float> &vector) {
  Batch batch;
  batch.emplace_back(chunk_id, vector);
  insert_batch(batch);
}

void VectorIndex::insert_batch(const Batch &entries) {
  if (entries.empty()) {
    return;
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);

  // Validate everything before touching the state.
  const size_t dimension =
      state_.dimension != 0 ? state_.dimension : entries.front().second.size();
  std::vector<std::vector<float>> units;
  units.reserve(entries.size());
  std::unordered_set<std::string> batch_ids;
  for (const auto &[chunk_id, vector] : entries) {
    if (chunk_id.empty()) {
      throw InvalidArgumentError("insert", "chunk id must not be empty");
    }
    if (state_.slot_by_id.count(chunk_id) > 0 || !batch_ids.insert(chunk_id).second) {
      throw DuplicateIdError("insert", chunk_id);
    }
    units.push_back(prepare_vector("insert", chunk_id, vector, dimension));
  }

  state_.dimension = dimension;
  for (size_t i = 0; i < entries.size(); ++i) {
    append_locked(entries[i].first, std::move(units[i]));
  }
  if (!graph_ && state_.entries.size() >= options_.approximate_threshold) {
    std::cout << "[VectorIndex] Switching to approximate search at " << state_.entries.size()
              << " entries" << std::endl;
    rebuild_graph_locked();
  }
}

void VectorIndex::append_locked(std::string chunk_id, std::vector<float> unit_vector) {
  Entry entry;
  entry.document_id = document_id_of(chunk_id);
  entry.chunk_id = std::move(chunk_id);
  entry.sequence = state_.next_sequence++;
  entry.vector = std::move(unit_vector);

  const size_t slot = state_.entries.size();
  state_.slot_by_id.emplace(entry.chunk_id, slot);
  state_.entries.push_back(std::move(entry));
  if (graph_) {
    graph_->add(static_cast<uint32_t>(slot), state_.entries.back().sequence);
  }
}

void VectorIndex::rebuild_graph_locked() {
  if (state_.entries.size() < options_.approximate_threshold) {
    graph_.reset();
    return;
  }
  graph_ = std::make_unique<HnswGraph>(
      state_.dimension, options_.hnsw_m, options_.hnsw_ef_construction,
      [this](uint32_t slot) { return state_.entries[slot].vector.data(); });
  for (size_t slot = 0; slot < state_.entries.size(); ++slot) {
    graph_->add(static_cast<uint32_t>(slot), state_.entries[slot].sequence);
  }
}

size_t VectorIndex::delete_by_document(const std::string &document_id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  const size_t before = state_.entries.size();
  state_.entries.erase(std::remove_if(state_.entries.begin(), state_.entries.end(),
                                      [&](const Entry &entry) {
                                        return entry.document_id == document_id;
                                      }),
                       state_.entries.end());
  const size_t removed = before - state_.entries.size();
  if (removed == 0) {
    return 0;
  }

  state_.slot_by_id.clear();
  for (size_t slot = 0; slot < state_.entries.size(); ++slot) {
    state_.slot_by_id.emplace(state_.entries[slot].chunk_id, slot);
  }
  if (graph_) {
    rebuild_graph_locked();
  }
  return removed;
}

std::vector<IndexSearchResult> VectorIndex::query(const std::vector<float> &vector, int k) const {
  if (k <= 0) {
    throw InvalidArgumentError("query", "k must be positive, got " + std::to_string(k));
  }

  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (state_.dimension == 0) {
    return {};
  }
  if (vector.size() != state_.dimension) {
    throw DimensionMismatchError("query", "expected dimension " +
                                              std::to_string(state_.dimension) + ", got " +
                                              std::to_string(vector.size()));
  }
  if (state_.entries.empty()) {
    return {};
  }

  std::vector<float> unit = vector;
  double norm = 0.0;
  for (float value : vector) {
    norm += static_cast<double>(value) * value;
  }
  norm = std::sqrt(norm);
  if (norm > 0.0) {
    for (auto &value : unit) {
      value = static_cast<float>(value / norm);
    }
  }

  const size_t wanted = std::min(static_cast<size_t>(k), state_.entries.size());
  return graph_ ? approximate_query_locked(unit, wanted) : exact_query_locked(unit, wanted);
}

std::vector<IndexSearchResult> VectorIndex::exact_query_locked(const std::vector<float> &query,
                                                               size_t k) const {
  std::vector<std::pair<float, size_t>> scored;
  scored.reserve(state_.entries.size());
  for (size_t slot = 0; slot < state_.entries.size(); ++slot) {
    const auto &v = state_.entries[slot].vector;
    float dot = 0.0f;
    for (size_t i = 0; i < v.size(); ++i) {
      dot += query[i] * v[i];
    }
    scored.emplace_back(dot, slot);
  }

  // Slots are in sequence order, so the slot breaks ties.
  std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(k), scored.end(),
                    [](const auto &a, const auto &b) {
                      if (a.first != b.first) {
                        return a.first > b.first;
                      }
                      return a.second < b.second;
                    });

  std::vector<IndexSearchResult> results;
  results.reserve(k);
  for (size_t i = 0; i < k; ++i) {
    results.push_back({state_.entries[scored[i].second].chunk_id, scored[i].first});
  }
  return results;
}

std::vector<IndexSearchResult> VectorIndex::approximate_query_locked(
    const std::vector<float> &query, size_t k) const {
  const auto hits = graph_->search(query.data(), k, std::max(options_.search_width, k));

  std::vector<std::pair<IndexSearchResult, uint64_t>> ranked;
  ranked.reserve(hits.size());
  for (const auto &[slot, score] : hits) {
    const auto &entry = state_.entries[slot];
    ranked.push_back({{entry.chunk_id, score}, entry.sequence});
  }
  std::sort(ranked.begin(), ranked.end(), [](const auto &a, const auto &b) {
    return ranks_before(a.first, a.second, b.first, b.second);
  });

  std::vector<IndexSearchResult> results;
  results.reserve(ranked.size());
  for (auto &item : ranked) {
    results.push_back(std::move(item.first));
  }
  return results;
}

void VectorIndex::persist(const std::filesystem::path &path) const {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  std::string image;
  image.append(kMagic, sizeof(kMagic));
  put_u32(image, kFormatVersion);
  put_u32(image, static_cast<uint32_t>(state_.dimension));
  put_u64(image, state_.entries.size());
  put_u64(image, state_.next_sequence);
  for (const auto &entry : state_.entries) {
    put_u32(image, static_cast<uint32_t>(entry.chunk_id.size()));
    image.append(entry.chunk_id);
    put_u64(image, entry.sequence);
    for (float value : entry.vector) {
      put_f32(image, value);
    }
  }
  const Sha256Digest digest = sha256_digest(image);
  image.append(reinterpret_cast<const char *>(digest.data()), digest.size());

  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  std::filesystem::path tmp_path = path;
  tmp_path += ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("Failed to open index file for writing: " + tmp_path.string());
    }
    out.write(image.data(), static_cast<std::streamsize>(image.size()));
    out.flush();
    if (!out) {
      throw std::runtime_error("Failed to write index file: " + tmp_path.string());
    }
  }
  std::filesystem::rename(tmp_path, path);
}

VectorIndex::State VectorIndex::parse_file(const std::string &bytes,
                                           const std::filesystem::path &path) {
  if (bytes.size() < kHeaderSize + kChecksumSize) {
    throw IndexLoadError("load", path.string() + ": file too small");
  }
  if (std::memcmp(bytes.data(), kMagic, sizeof(kMagic)) != 0) {
    throw IndexLoadError("load", path.string() + ": not an index file");
  }

  const size_t body_size = bytes.size() - kChecksumSize;
  const Sha256Digest digest = sha256_digest(std::string_view(bytes.data(), body_size));
  if (std::memcmp(digest.data(), bytes.data() + body_size, kChecksumSize) != 0) {
    throw IndexLoadError("load", path.string() + ": checksum mismatch");
  }

  Reader reader(bytes, body_size, path);
  reader.string(sizeof(kMagic));
  const uint32_t version = reader.u32();
  if (version != kFormatVersion) {
    throw IndexLoadError("load", path.string() + ": unsupported format version " +
                                     std::to_string(version));
  }

  State state;
  state.dimension = reader.u32();
  const uint64_t count = reader.u64();
  state.next_sequence = reader.u64();
  if (count > 0 && state.dimension == 0) {
    throw IndexLoadError("load", path.string() + ": entries without a dimension");
  }
  // Every entry takes at least 4 + 8 + 4*dimension bytes.
  if (count > reader.remaining() / (12 + 4 * static_cast<uint64_t>(state.dimension))) {
    throw IndexLoadError("load", path.string() + ": entry count exceeds file size");
  }

  state.entries.reserve(static_cast<size_t>(count));
  for (uint64_t i = 0; i < count; ++i) {
    Entry entry;
    entry.chunk_id = reader.string(reader.u32());
    entry.sequence = reader.u64();
    entry.vector.resize(state.dimension);
    for (size_t d = 0; d < state.dimension; ++d) {
      entry.vector[d] = reader.f32();
    }
    if (entry.chunk_id.empty()) {
      throw IndexLoadError("load", path.string() + ": empty chunk id");
    }
    if (entry.sequence >= state.next_sequence ||
        (!state.entries.empty() && entry.sequence <= state.entries.back().sequence)) {
      throw IndexLoadError("load", path.string() + ": sequence numbers out of order");
    }
    if (!state.slot_by_id.emplace(entry.chunk_id, state.entries.size()).second) {
      throw IndexLoadError("load", path.string() + ": duplicate chunk id " + entry.chunk_id);
    }
    entry.document_id = document_id_of(entry.chunk_id);
    state.entries.push_back(std::move(entry));
  }
  if (reader.remaining() != 0) {
    throw IndexLoadError("load", path.string() + ": trailing bytes after entries");
  }
  return state;
}

void VectorIndex::load(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw IndexLoadError("load", path.string() + ": cannot open file");
  }
  std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw IndexLoadError("load", path.string() + ": read failed");
  }

  State staged = parse_file(bytes, path);
  if (options_.dimension != 0 && staged.dimension != 0 &&
      staged.dimension != options_.dimension) {
    throw IndexLoadError("load", path.string() + ": dimension " +
                                     std::to_string(staged.dimension) + " does not match " +
                                     std::to_string(options_.dimension));
  }
  if (staged.dimension == 0) {
    staged.dimension = options_.dimension;
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  state_ = std::move(staged);
  graph_.reset();
  rebuild_graph_locked();
  std::cout << "[VectorIndex] Loaded " << state_.entries.size() << " entries from " << path
            << std::endl;
}

size_t VectorIndex::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_.entries.size();
}

size_t VectorIndex::dimension() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_.dimension;
}

bool VectorIndex::contains(const std::string &chunk_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_.slot_by_id.count(chunk_id) > 0;
}

bool VectorIndex::is_approximate() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return graph_ != nullptr;
}

void VectorIndex::set_search_width(size_t search_width) {
  if (search_width == 0) {
    throw InvalidArgumentError("set_search_width", "search width must be positive");
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  options_.search_width = search_width;
}

}  // namespace docqa_core
