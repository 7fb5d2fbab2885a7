#include <ledgersync/crypto/sha256.hpp>
#include <ledgersync/schema/snapshot.hpp>

#include <utility>

namespace ledgersync::schema {

snapshot::snapshot(const snapshot_id_t id,
                   const uint64_t height,
                   const hash32_t& block_hash)
    : id_{id}, height_{height}, block_hash_{block_hash} {}

void snapshot::set_id(const snapshot_id_t id) {
  id_ = id;
}

void snapshot::set_height(const uint64_t height) {
  height_ = height;
}

void snapshot::set_block_hash(const hash32_t& block_hash) {
  block_hash_ = block_hash;
}

void snapshot::add_chunk_id(const chunk_id_t chunk_id) {
  chunk_ids_.push_back(chunk_id);
  chunk_index_.insert(chunk_id);
}

void snapshot::set_chunk_ids(std::vector<chunk_id_t> chunk_ids) {
  chunk_ids_ = std::move(chunk_ids);
  chunk_index_ = std::set<chunk_id_t>{std::begin(chunk_ids_),
                                      std::end(chunk_ids_)};
}

void snapshot::add_block_id(const block_number_t block_id) {
  block_ids_.push_back(block_id);
  block_index_.insert(block_id);
}

void snapshot::set_block_ids(std::vector<block_number_t> block_ids) {
  block_ids_ = std::move(block_ids);
  block_index_ = std::set<block_number_t>{std::begin(block_ids_),
                                          std::end(block_ids_)};
}

bool snapshot::add_chunk_id_if_absent(const chunk_id_t chunk_id) {
  if (!chunk_index_.insert(chunk_id).second) {
    return false;
  }
  chunk_ids_.push_back(chunk_id);
  return true;
}

bool snapshot::add_block_id_if_absent(const block_number_t block_id) {
  if (!block_index_.insert(block_id).second) {
    return false;
  }
  block_ids_.push_back(block_id);
  return true;
}

bool snapshot::contains_chunk_id(const chunk_id_t chunk_id) const {
  return chunk_index_.contains(chunk_id);
}

bool snapshot::contains_block_id(const block_number_t block_id) const {
  return block_index_.contains(block_id);
}

std::optional<chunk_id_t> snapshot::latest_chunk_id() const {
  if (chunk_ids_.empty()) {
    return std::nullopt;
  }
  return chunk_ids_.back();
}

std::optional<chunk_id_t> snapshot::oldest_chunk_id() const {
  if (chunk_ids_.empty()) {
    return std::nullopt;
  }
  return chunk_ids_.front();
}

std::size_t snapshot::size() const {
  return sizeof(uint64_t) + block_hash_.size() +
         (block_ids_.size() * sizeof(block_number_t)) +
         (chunk_ids_.size() * sizeof(chunk_id_t));
}

hash32_t snapshot::hash() const {
  auto hasher = ledgersync::crypto::sha256_hasher{};
  hasher.update(id_);
  hasher.update(height_);
  for (const auto chunk_id : chunk_ids_) {
    hasher.update(chunk_id);
  }
  for (const auto block_id : block_ids_) {
    hasher.update(block_id);
  }
  hasher.update(bytes_view_t{block_hash_});
  return hasher.finalize();
}

bool snapshot::operator==(const snapshot& other) const {
  return id_ == other.id_ && height_ == other.height_ &&
         chunk_ids_ == other.chunk_ids_ && block_ids_ == other.block_ids_ &&
         block_hash_ == other.block_hash_;
}

}  // namespace ledgersync::schema
