#pragma once
#include <ledgersync/schema/primitives.hpp>
#include <ledgersync/schema/snapshot.hpp>
#include <ledgersync/schema/snapshot_chunk.hpp>
#include <ledgersync/schema/snapshot_sync.hpp>
#include <ledgersync/schema/wallet_state_sync_record.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace ledgersync::storage {

using key_value_entry_t =
    std::pair<ledgersync::schema::bytes_t, ledgersync::schema::bytes_t>;

using chunk_entry_t =
    std::pair<ledgersync::schema::chunk_id_t, ledgersync::schema::snapshot_chunk>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const ledgersync::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const ledgersync::schema::bytes_view_t& key,
           const T& value);

  /// Persist the snapshot row keyed by its id.
  void save_snapshot(const ledgersync::schema::snapshot& snapshot) const;
  std::optional<ledgersync::schema::snapshot> load_snapshot(
      ledgersync::schema::snapshot_id_t snapshot_id) const;

  /// Persist one chunk of the snapshot named by `chunk.snapshot_id()`.
  void save_snapshot_chunk(ledgersync::schema::chunk_id_t chunk_id,
                           const ledgersync::schema::snapshot_chunk& chunk) const;
  std::optional<ledgersync::schema::snapshot_chunk> load_snapshot_chunk(
      ledgersync::schema::snapshot_id_t snapshot_id,
      ledgersync::schema::chunk_id_t chunk_id) const;

  /// All chunks of a snapshot in ascending chunk id order.
  std::vector<chunk_entry_t> list_snapshot_chunks(
      ledgersync::schema::snapshot_id_t snapshot_id) const;

  void save_snapshot_sync(ledgersync::schema::snapshot_sync_id_t sync_id,
                          const ledgersync::schema::snapshot_sync& sync) const;
  std::optional<ledgersync::schema::snapshot_sync> load_snapshot_sync(
      ledgersync::schema::snapshot_sync_id_t sync_id) const;

  /// Atomically persist a chunk arrival: chunk row, snapshot row and progress.
  /// Returns false, writing nothing, when the chunk belongs to another
  /// snapshot.
  bool commit_chunk(ledgersync::schema::snapshot_sync_id_t sync_id,
                    const ledgersync::schema::snapshot_sync& sync,
                    const ledgersync::schema::snapshot& snapshot,
                    ledgersync::schema::chunk_id_t chunk_id,
                    const ledgersync::schema::snapshot_chunk& chunk) const;

  /// Atomically drop a snapshot, its chunks and its progress row.
  void discard_snapshot(ledgersync::schema::snapshot_id_t snapshot_id,
                        ledgersync::schema::snapshot_sync_id_t sync_id) const;

  void save_wallet_sync_record(
      const ledgersync::schema::wallet_state_sync_record& record) const;
  std::optional<ledgersync::schema::wallet_state_sync_record>
  load_wallet_sync_record(const ledgersync::schema::session_id_t& session_id,
                          const ledgersync::schema::peer_id_t& peer_id) const;

  /// Every peer record persisted for a wallet sync session.
  std::vector<ledgersync::schema::wallet_state_sync_record>
  list_wallet_sync_records(
      const ledgersync::schema::session_id_t& session_id) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const ledgersync::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace ledgersync::storage
