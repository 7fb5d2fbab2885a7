#include <ledgersync/schema/key/builder.hpp>
#include <ledgersync/schema/key/sync_keys.hpp>

#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <cstring>

namespace ledgersync::schema::key {

bytes_t make_snapshot_key(const snapshot_id_t snapshot_id) {
  auto b = builder{};
  b.write(kSnapshotKeyPrefix);
  b.write(snapshot_id);
  return b.data;
}

bytes_t make_snapshot_chunk_key(const snapshot_id_t snapshot_id,
                                const chunk_id_t chunk_id) {
  auto b = builder{};
  b.write(kSnapshotChunkKeyPrefix);
  b.write(snapshot_id);
  b.write(std::string_view{"|"});
  b.write(chunk_id);
  return b.data;
}

bytes_t make_snapshot_chunk_prefix(const snapshot_id_t snapshot_id) {
  auto b = builder{};
  b.write(kSnapshotChunkKeyPrefix);
  b.write(snapshot_id);
  b.write(std::string_view{"|"});
  return b.data;
}

bytes_t make_snapshot_sync_key(const snapshot_sync_id_t snapshot_sync_id) {
  auto b = builder{};
  b.write(kSnapshotSyncKeyPrefix);
  b.write(snapshot_sync_id);
  return b.data;
}

bytes_t make_wallet_sync_record_key(const session_id_t& session_id,
                                    const peer_id_t& peer_id) {
  auto b = builder{};
  b.write(kWalletSyncKeyPrefix);
  b.write(std::span(session_id.data(), session_id.size()));
  b.write(std::string_view{"|"});
  b.write(std::span(peer_id.data(), peer_id.size()));
  return b.data;
}

bytes_t make_wallet_sync_session_prefix(const session_id_t& session_id) {
  auto b = builder{};
  b.write(kWalletSyncKeyPrefix);
  b.write(std::span(session_id.data(), session_id.size()));
  b.write(std::string_view{"|"});
  return b.data;
}

std::optional<chunk_id_t> parse_snapshot_chunk_key(const bytes_view_t& key) {
  // prefix | snapshot id (8) | '|' | chunk id (8)
  constexpr auto kExpectedSize =
      kSnapshotChunkKeyPrefix.size() + sizeof(snapshot_id_t) + 1 +
      sizeof(chunk_id_t);
  if (key.size() != kExpectedSize ||
      !std::equal(std::begin(kSnapshotChunkKeyPrefix),
                  std::end(kSnapshotChunkKeyPrefix), std::begin(key),
                  [](const char lhs, const uint8_t rhs) {
                    return static_cast<uint8_t>(lhs) == rhs;
                  })) {
    return std::nullopt;
  }
  auto chunk_id = chunk_id_t{};
  std::memcpy(&chunk_id, key.data() + (key.size() - sizeof(chunk_id_t)),
              sizeof(chunk_id_t));
  return boost::endian::big_to_native(chunk_id);
}

}  // namespace ledgersync::schema::key
