#pragma once

#include <ledgersync/schema/primitives.hpp>
#include <string_view>

// Schema key type: sync keys.
// Canonical RocksDB keyspaces for snapshot sync and wallet state sync rows.
// The version segment changes whenever a row layout changes.
namespace ledgersync::schema::key {

inline constexpr std::string_view kSyncPrefix{"SYS|SYNC|"};
inline constexpr std::string_view kSnapshotKeyPrefix{"SYS|SYNC|V1|SNAP|"};
inline constexpr std::string_view kSnapshotChunkKeyPrefix{
    "SYS|SYNC|V1|CHUNK|"};
inline constexpr std::string_view kSnapshotSyncKeyPrefix{
    "SYS|SYNC|V1|PROGRESS|"};
inline constexpr std::string_view kWalletSyncKeyPrefix{"SYS|SYNC|V1|WALLET|"};

ledgersync::schema::bytes_t make_snapshot_key(snapshot_id_t snapshot_id);

ledgersync::schema::bytes_t make_snapshot_chunk_key(snapshot_id_t snapshot_id,
                                                    chunk_id_t chunk_id);
ledgersync::schema::bytes_t make_snapshot_chunk_prefix(
    snapshot_id_t snapshot_id);

ledgersync::schema::bytes_t make_snapshot_sync_key(
    snapshot_sync_id_t snapshot_sync_id);

ledgersync::schema::bytes_t make_wallet_sync_record_key(
    const session_id_t& session_id,
    const peer_id_t& peer_id);
ledgersync::schema::bytes_t make_wallet_sync_session_prefix(
    const session_id_t& session_id);

/// Extract the chunk id from a key built by make_snapshot_chunk_key.
std::optional<chunk_id_t> parse_snapshot_chunk_key(
    const ledgersync::schema::bytes_view_t& key);

}  // namespace ledgersync::schema::key
