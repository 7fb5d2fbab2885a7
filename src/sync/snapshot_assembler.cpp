#include <ledgersync/sync/snapshot_assembler.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

using namespace ledgersync::schema;

namespace ledgersync::sync {

snapshot_assembler::snapshot_assembler(ledgersync::schema::snapshot snapshot,
                                       snapshot_sync progress)
    : snapshot_{std::move(snapshot)}, progress_{std::move(progress)} {
  if (!snapshot_.block_ids().empty()) {
    last_ending_block_ = *std::ranges::max_element(snapshot_.block_ids());
  }
  if (progress_.last_applied_chunk_index() > progress_.total_chunks()) {
    spdlog::warn(
        "Snapshot {} progress {} exceeds total chunk count {}", snapshot_.id(),
        progress_.last_applied_chunk_index(), progress_.total_chunks());
  }
  if (progress_.is_complete()) {
    verified_ = snapshot_.hash() == progress_.snapshot_hash();
  }
  spdlog::debug("Assembling snapshot {} at height {}: {}/{} chunks applied",
                snapshot_.id(), snapshot_.height(),
                progress_.last_applied_chunk_index(), progress_.total_chunks());
}

apply_snapshot_chunk_result snapshot_assembler::apply_chunk(
    const chunk_id_t chunk_id,
    const snapshot_chunk& chunk) {
  auto result = apply(chunk_id, chunk);
  spdlog::debug("Chunk {} of snapshot {}: {}", chunk_id, snapshot_.id(),
                to_string(result));
  return result;
}

apply_snapshot_chunk_result snapshot_assembler::apply(
    const chunk_id_t chunk_id,
    const snapshot_chunk& chunk) {
  if (chunk.snapshot_id() != snapshot_.id()) {
    spdlog::warn("Chunk {} belongs to snapshot {}, expected snapshot {}",
                 chunk_id, chunk.snapshot_id(), snapshot_.id());
    return apply_snapshot_chunk_result::retry;
  }
  if (snapshot_.contains_chunk_id(chunk_id)) {
    spdlog::debug("Ignoring duplicate chunk {} of snapshot {}", chunk_id,
                  snapshot_.id());
    return apply_snapshot_chunk_result::accept;
  }
  if (progress_.is_complete()) {
    spdlog::warn("Snapshot {} already has all {} chunks; dropping chunk {}",
                 snapshot_.id(), progress_.total_chunks(), chunk_id);
    return apply_snapshot_chunk_result::abort;
  }

  const auto starting = chunk.starting_block_number();
  const auto ending = chunk.ending_block_number();
  const auto last = std::max(starting, ending);
  // Compared as a difference: `last - starting + 1` wraps at the top of u64.
  if (last - starting >= chunk.data().size()) {
    spdlog::warn("Chunk {} of snapshot {} claims blocks {}-{} but carries {} "
                 "payloads",
                 chunk_id, snapshot_.id(), starting, last, chunk.data().size());
    return apply_snapshot_chunk_result::retry;
  }
  if (!chunk.spans_valid_range()) {
    spdlog::warn("Chunk {} of snapshot {} ends at block {} before it starts "
                 "at block {}",
                 chunk_id, snapshot_.id(), ending, starting);
  } else if (last_ending_block_ && starting <= *last_ending_block_) {
    spdlog::warn("Chunk {} of snapshot {} starts at block {}, not after "
                 "block {}",
                 chunk_id, snapshot_.id(), starting, *last_ending_block_);
  }

  snapshot_.add_chunk_id_if_absent(chunk_id);
  for (auto block = starting;; ++block) {
    snapshot_.add_block_id_if_absent(block);
    if (block == last) {
      break;
    }
  }
  last_ending_block_ = std::max(last_ending_block_.value_or(last), last);

  progress_.set_last_applied_chunk_index(
      progress_.last_applied_chunk_index() + 1);
  spdlog::info("Applied chunk {} of snapshot {} ({}/{})", chunk_id,
               snapshot_.id(), progress_.last_applied_chunk_index(),
               progress_.total_chunks());

  if (progress_.is_complete()) {
    return verify();
  }
  return apply_snapshot_chunk_result::accept;
}

bool snapshot_assembler::is_complete() const {
  return progress_.is_complete();
}

bool snapshot_assembler::is_verified() const {
  return verified_;
}

apply_snapshot_chunk_result snapshot_assembler::verify() {
  auto computed = snapshot_.hash();
  verified_ = computed == progress_.snapshot_hash();
  if (!verified_) {
    spdlog::error("Snapshot {} at height {} hash mismatch: computed {}, "
                  "expected {}",
                  snapshot_.id(), snapshot_.height(),
                  to_hex(bytes_view_t{computed}),
                  to_hex(bytes_view_t{progress_.snapshot_hash()}));
    return apply_snapshot_chunk_result::reject_snapshot;
  }
  spdlog::info("Snapshot {} at height {} verified", snapshot_.id(),
               snapshot_.height());
  return apply_snapshot_chunk_result::accept;
}

}  // namespace ledgersync::sync
