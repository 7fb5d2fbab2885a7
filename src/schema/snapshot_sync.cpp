#include <ledgersync/schema/snapshot_sync.hpp>

namespace ledgersync::schema {

snapshot_sync::snapshot_sync(const uint64_t height,
                             const hash32_t& snapshot_hash,
                             const uint64_t format,
                             const uint64_t total_chunks)
    : height_{height},
      total_chunks_{total_chunks},
      snapshot_hash_{snapshot_hash},
      format_{format} {}

void snapshot_sync::set_height(const uint64_t height) {
  height_ = height;
}

void snapshot_sync::set_total_chunks(const uint64_t total_chunks) {
  total_chunks_ = total_chunks;
}

void snapshot_sync::set_last_applied_chunk_index(const chunk_index_t index) {
  last_applied_chunk_index_ = index;
}

bool snapshot_sync::is_complete() const {
  return last_applied_chunk_index_ == total_chunks_;
}

uint64_t snapshot_sync::remaining_chunks() const {
  if (last_applied_chunk_index_ >= total_chunks_) {
    return 0;
  }
  return total_chunks_ - last_applied_chunk_index_;
}

}  // namespace ledgersync::schema
