#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <ledgersync/common/critical.hpp>
#include <ledgersync/schema/encoding/scale/encoder.hpp>
#include <ledgersync/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace ledgersync::storage {

namespace detail {

using encoder_t = ledgersync::schema::encoding::encoder<
    ledgersync::schema::encoding::scale_encoder_tag>;

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const ledgersync::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline ledgersync::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ledgersync::schema::bytes_view_t to_bytes_view(const std::string& raw) {
  return ledgersync::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(raw.data()), raw.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const ledgersync::schema::bytes_view_t& key);

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const ledgersync::schema::bytes_view_t& key,
           const T& value);

  void save_snapshot(const ledgersync::schema::snapshot& snapshot) const;
  std::optional<ledgersync::schema::snapshot> load_snapshot(
      ledgersync::schema::snapshot_id_t snapshot_id) const;
  void save_snapshot_chunk(ledgersync::schema::chunk_id_t chunk_id,
                           const ledgersync::schema::snapshot_chunk& chunk) const;
  std::optional<ledgersync::schema::snapshot_chunk> load_snapshot_chunk(
      ledgersync::schema::snapshot_id_t snapshot_id,
      ledgersync::schema::chunk_id_t chunk_id) const;
  std::vector<chunk_entry_t> list_snapshot_chunks(
      ledgersync::schema::snapshot_id_t snapshot_id) const;
  void save_snapshot_sync(ledgersync::schema::snapshot_sync_id_t sync_id,
                          const ledgersync::schema::snapshot_sync& sync) const;
  std::optional<ledgersync::schema::snapshot_sync> load_snapshot_sync(
      ledgersync::schema::snapshot_sync_id_t sync_id) const;
  bool commit_chunk(ledgersync::schema::snapshot_sync_id_t sync_id,
                    const ledgersync::schema::snapshot_sync& sync,
                    const ledgersync::schema::snapshot& snapshot,
                    ledgersync::schema::chunk_id_t chunk_id,
                    const ledgersync::schema::snapshot_chunk& chunk) const;
  void discard_snapshot(ledgersync::schema::snapshot_id_t snapshot_id,
                        ledgersync::schema::snapshot_sync_id_t sync_id) const;
  void save_wallet_sync_record(
      const ledgersync::schema::wallet_state_sync_record& record) const;
  std::optional<ledgersync::schema::wallet_state_sync_record>
  load_wallet_sync_record(const ledgersync::schema::session_id_t& session_id,
                          const ledgersync::schema::peer_id_t& peer_id) const;
  std::vector<ledgersync::schema::wallet_state_sync_record>
  list_wallet_sync_records(
      const ledgersync::schema::session_id_t& session_id) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const ledgersync::schema::bytes_view_t& prefix) const;

 private:
  void ensure_open() const;
  std::optional<std::string> get_raw(
      const ledgersync::schema::bytes_view_t& key) const;
  void put_raw(const ledgersync::schema::bytes_view_t& key,
               const ledgersync::schema::bytes_view_t& value) const;
  void write(ROCKSDB_NAMESPACE::WriteBatch& batch,
             std::string_view what) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const ledgersync::schema::bytes_view_t& key) {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(detail::to_bytes_view(*value))};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const ledgersync::schema::bytes_view_t& key,
    const T& value) {
  auto encoded_value = encoder.encode(value);
  put_raw(key, ledgersync::schema::bytes_view_t{encoded_value});
}

}  // namespace ledgersync::storage
