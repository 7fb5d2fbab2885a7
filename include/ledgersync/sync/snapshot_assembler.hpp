#pragma once

#include <ledgersync/schema/apply_snapshot_chunk_result.hpp>
#include <ledgersync/schema/primitives.hpp>
#include <ledgersync/schema/snapshot.hpp>
#include <ledgersync/schema/snapshot_chunk.hpp>
#include <ledgersync/schema/snapshot_sync.hpp>
#include <optional>

namespace ledgersync::sync {

/// Applies received chunks to one snapshot and tracks resumable progress.
///
/// Each accepted chunk registers its id and every block number of its range
/// in the snapshot, then advances the applied index. A chunk carries one
/// payload per block, so its range may not be wider than its payload count. When the index reaches
/// the expected chunk count the snapshot hash is compared with the target
/// carried by the progress tracker.
///
/// One owner per snapshot; not thread safe.
class snapshot_assembler final {
 public:
  /// Start or resume assembly. A resumed snapshot keeps the chunk and block
  /// ids it already holds.
  snapshot_assembler(ledgersync::schema::snapshot snapshot,
                     ledgersync::schema::snapshot_sync progress);

  /// Apply one chunk.
  ///
  /// - `accept`: applied, or a duplicate chunk id (progress unchanged).
  /// - `retry`: the chunk belongs to another snapshot, or claims more blocks
  ///   than it carries payloads. Nothing is registered.
  /// - `abort`: progress was already complete.
  /// - `reject_snapshot`: the last chunk completed a snapshot whose hash does
  ///   not match the target.
  ledgersync::schema::apply_snapshot_chunk_result apply_chunk(
      ledgersync::schema::chunk_id_t chunk_id,
      const ledgersync::schema::snapshot_chunk& chunk);

  bool is_complete() const;

  /// True once complete and the computed hash matched the target.
  bool is_verified() const;

  const ledgersync::schema::snapshot& snapshot() const { return snapshot_; }
  const ledgersync::schema::snapshot_sync& progress() const {
    return progress_;
  }

 private:
  ledgersync::schema::apply_snapshot_chunk_result apply(
      ledgersync::schema::chunk_id_t chunk_id,
      const ledgersync::schema::snapshot_chunk& chunk);
  ledgersync::schema::apply_snapshot_chunk_result verify();

  ledgersync::schema::snapshot snapshot_;
  ledgersync::schema::snapshot_sync progress_;
  std::optional<ledgersync::schema::block_number_t> last_ending_block_;
  bool verified_{false};
};

}  // namespace ledgersync::sync
