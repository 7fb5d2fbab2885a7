#pragma once

#include <ledgersync/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <set>
#include <vector>

// Schema type: snapshot.
// State sync aggregate: chain state captured at a height, distributed as
// chunks. Its content hash is what independently syncing nodes compare.
namespace ledgersync::schema {

class snapshot final {
 public:
  snapshot() = default;
  snapshot(snapshot_id_t id, uint64_t height, const hash32_t& block_hash);

  void set_id(snapshot_id_t id);
  void set_height(uint64_t height);
  void set_block_hash(const hash32_t& block_hash);

  /// Plain appends and replacements. Duplicates are allowed here.
  void add_chunk_id(chunk_id_t chunk_id);
  void set_chunk_ids(std::vector<chunk_id_t> chunk_ids);
  void add_block_id(block_number_t block_id);
  void set_block_ids(std::vector<block_number_t> block_ids);

  /// Append `chunk_id` unless the sequence already holds it.
  /// Returns false, leaving the snapshot untouched, for a duplicate.
  bool add_chunk_id_if_absent(chunk_id_t chunk_id);

  /// Append `block_id` unless the sequence already holds it.
  bool add_block_id_if_absent(block_number_t block_id);

  bool contains_chunk_id(chunk_id_t chunk_id) const;
  bool contains_block_id(block_number_t block_id) const;

  std::optional<chunk_id_t> latest_chunk_id() const;
  std::optional<chunk_id_t> oldest_chunk_id() const;

  /// Storage footprint: height, block hash and eight bytes per id.
  std::size_t size() const;

  /// SHA-256 over id, height, chunk ids and block ids (each as little-endian
  /// u64, in append order) followed by the block hash bytes.
  hash32_t hash() const;

  snapshot_id_t id() const { return id_; }
  uint64_t height() const { return height_; }
  const std::vector<chunk_id_t>& chunk_ids() const { return chunk_ids_; }
  const std::vector<block_number_t>& block_ids() const { return block_ids_; }
  const hash32_t& block_hash() const { return block_hash_; }

  bool operator==(const snapshot& other) const;

 private:
  snapshot_id_t id_{};
  uint64_t height_{};
  std::vector<chunk_id_t> chunk_ids_;
  std::vector<block_number_t> block_ids_;
  hash32_t block_hash_{};

  // Always the set of values held by the matching sequence.
  std::set<chunk_id_t> chunk_index_;
  std::set<block_number_t> block_index_;
};

}  // namespace ledgersync::schema
