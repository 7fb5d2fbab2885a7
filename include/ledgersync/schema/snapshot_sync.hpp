#pragma once

#include <ledgersync/schema/primitives.hpp>
#include <cstdint>

// Schema type: snapshot sync progress.
// State sync resume point: how many of a snapshot's chunks were applied
// locally and which snapshot hash the assembled result must reproduce.
namespace ledgersync::schema {

class snapshot_sync final {
 public:
  snapshot_sync() = default;
  snapshot_sync(uint64_t height,
                const hash32_t& snapshot_hash,
                uint64_t format,
                uint64_t total_chunks);

  void set_height(uint64_t height);
  void set_total_chunks(uint64_t total_chunks);

  /// Overwrite the resume point. Bounds and monotonicity are not checked.
  void set_last_applied_chunk_index(chunk_index_t index);

  bool is_complete() const;
  uint64_t remaining_chunks() const;

  uint64_t height() const { return height_; }
  uint64_t total_chunks() const { return total_chunks_; }
  chunk_index_t last_applied_chunk_index() const {
    return last_applied_chunk_index_;
  }
  const hash32_t& snapshot_hash() const { return snapshot_hash_; }
  uint64_t format() const { return format_; }

  bool operator==(const snapshot_sync&) const = default;

 private:
  uint64_t height_{};
  uint64_t total_chunks_{};
  chunk_index_t last_applied_chunk_index_{};
  hash32_t snapshot_hash_{};
  uint64_t format_{};
};

}  // namespace ledgersync::schema
