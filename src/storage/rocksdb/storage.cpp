#include <ledgersync/common/critical.hpp>
#include <ledgersync/schema/key/sync_keys.hpp>
#include <ledgersync/storage/rocksdb/storage.hpp>

#include <array>
#include <iterator>
#include <utility>

using namespace ledgersync::schema;

namespace ledgersync::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    ledgersync::common::critical("Failed to open RocksDB at {}: {}", path,
                                 status.ToString());
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

void storage<rocksdb_storage_tag>::ensure_open() const {
  if (!database) {
    ledgersync::common::critical("RocksDB database is not initialized");
  }
}

std::optional<std::string> storage<rocksdb_storage_tag>::get_raw(
    const bytes_view_t& key) const {
  ensure_open();
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    ledgersync::common::critical("Failed to get value from RocksDB: {}",
                                 status.ToString());
  }
  return value;
}

void storage<rocksdb_storage_tag>::put_raw(const bytes_view_t& key,
                                           const bytes_view_t& value) const {
  ensure_open();
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(key), detail::to_slice(value));
  if (!status.ok()) {
    ledgersync::common::critical("Failed to put value into RocksDB: {}",
                                 status.ToString());
  }
}

void storage<rocksdb_storage_tag>::write(ROCKSDB_NAMESPACE::WriteBatch& batch,
                                         const std::string_view what) const {
  ensure_open();
  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    ledgersync::common::critical("Failed to commit {}: {}", what,
                                 status.ToString());
  }
}

void storage<rocksdb_storage_tag>::save_snapshot(
    const snapshot& snapshot) const {
  auto encoder = detail::encoder_t{};
  auto row_key = key::make_snapshot_key(snapshot.id());
  auto encoded = encoder.encode(snapshot);
  put_raw(bytes_view_t{row_key}, bytes_view_t{encoded});
}

std::optional<snapshot> storage<rocksdb_storage_tag>::load_snapshot(
    const snapshot_id_t snapshot_id) const {
  auto row_key = key::make_snapshot_key(snapshot_id);
  auto raw = get_raw(bytes_view_t{row_key});
  if (!raw) {
    return std::nullopt;
  }
  auto encoder = detail::encoder_t{};
  auto decoded = encoder.try_decode<snapshot>(detail::to_bytes_view(*raw));
  if (!decoded) {
    spdlog::warn("Failed decoding snapshot {}", snapshot_id);
  }
  return decoded;
}

void storage<rocksdb_storage_tag>::save_snapshot_chunk(
    const chunk_id_t chunk_id,
    const snapshot_chunk& chunk) const {
  auto encoder = detail::encoder_t{};
  auto row_key = key::make_snapshot_chunk_key(chunk.snapshot_id(), chunk_id);
  auto encoded = encoder.encode(chunk);
  put_raw(bytes_view_t{row_key}, bytes_view_t{encoded});
}

std::optional<snapshot_chunk>
storage<rocksdb_storage_tag>::load_snapshot_chunk(
    const snapshot_id_t snapshot_id,
    const chunk_id_t chunk_id) const {
  auto row_key = key::make_snapshot_chunk_key(snapshot_id, chunk_id);
  auto raw = get_raw(bytes_view_t{row_key});
  if (!raw) {
    return std::nullopt;
  }
  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<snapshot_chunk>(detail::to_bytes_view(*raw));
  if (!decoded) {
    spdlog::warn("Failed decoding chunk {} of snapshot {}", chunk_id,
                 snapshot_id);
  }
  return decoded;
}

std::vector<chunk_entry_t> storage<rocksdb_storage_tag>::list_snapshot_chunks(
    const snapshot_id_t snapshot_id) const {
  auto prefix = key::make_snapshot_chunk_prefix(snapshot_id);
  auto encoder = detail::encoder_t{};
  auto chunks = std::vector<chunk_entry_t>{};
  for (const auto& [raw_key, raw_value] : list_by_prefix(bytes_view_t{prefix})) {
    auto chunk_id = key::parse_snapshot_chunk_key(bytes_view_t{raw_key});
    auto chunk = encoder.try_decode<snapshot_chunk>(bytes_view_t{raw_value});
    if (!chunk_id || !chunk) {
      spdlog::warn("Skipping undecodable chunk row of snapshot {}",
                   snapshot_id);
      continue;
    }
    chunks.emplace_back(*chunk_id, std::move(*chunk));
  }
  return chunks;
}

void storage<rocksdb_storage_tag>::save_snapshot_sync(
    const snapshot_sync_id_t sync_id,
    const snapshot_sync& sync) const {
  auto encoder = detail::encoder_t{};
  auto row_key = key::make_snapshot_sync_key(sync_id);
  auto encoded = encoder.encode(sync);
  put_raw(bytes_view_t{row_key}, bytes_view_t{encoded});
}

std::optional<snapshot_sync> storage<rocksdb_storage_tag>::load_snapshot_sync(
    const snapshot_sync_id_t sync_id) const {
  auto row_key = key::make_snapshot_sync_key(sync_id);
  auto raw = get_raw(bytes_view_t{row_key});
  if (!raw) {
    return std::nullopt;
  }
  auto encoder = detail::encoder_t{};
  auto decoded = encoder.try_decode<snapshot_sync>(detail::to_bytes_view(*raw));
  if (!decoded) {
    spdlog::warn("Failed decoding snapshot sync {}", sync_id);
  }
  return decoded;
}

bool storage<rocksdb_storage_tag>::commit_chunk(
    const snapshot_sync_id_t sync_id,
    const snapshot_sync& sync,
    const snapshot& snapshot,
    const chunk_id_t chunk_id,
    const snapshot_chunk& chunk) const {
  if (chunk.snapshot_id() != snapshot.id()) {
    spdlog::error("Refusing to commit chunk {} of snapshot {} with snapshot {}",
                  chunk_id, chunk.snapshot_id(), snapshot.id());
    return false;
  }
  auto encoder = detail::encoder_t{};
  auto chunk_key = key::make_snapshot_chunk_key(chunk.snapshot_id(), chunk_id);
  auto snapshot_key = key::make_snapshot_key(snapshot.id());
  auto sync_key = key::make_snapshot_sync_key(sync_id);
  auto encoded_chunk = encoder.encode(chunk);
  auto encoded_snapshot = encoder.encode(snapshot);
  auto encoded_sync = encoder.encode(sync);

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  auto statuses = std::array{
      batch.Put(detail::to_slice(bytes_view_t{chunk_key}),
                detail::to_slice(bytes_view_t{encoded_chunk})),
      batch.Put(detail::to_slice(bytes_view_t{snapshot_key}),
                detail::to_slice(bytes_view_t{encoded_snapshot})),
      batch.Put(detail::to_slice(bytes_view_t{sync_key}),
                detail::to_slice(bytes_view_t{encoded_sync}))};
  for (const auto& status : statuses) {
    if (!status.ok()) {
      ledgersync::common::critical("Failed staging chunk {} of snapshot {}: {}",
                                   chunk_id, chunk.snapshot_id(),
                                   status.ToString());
    }
  }
  write(batch, "chunk commit");
  return true;
}

void storage<rocksdb_storage_tag>::discard_snapshot(
    const snapshot_id_t snapshot_id,
    const snapshot_sync_id_t sync_id) const {
  ensure_open();
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  auto snapshot_key = key::make_snapshot_key(snapshot_id);
  auto sync_key = key::make_snapshot_sync_key(sync_id);
  auto chunk_prefix = key::make_snapshot_chunk_prefix(snapshot_id);

  if (!batch.Delete(detail::to_slice(bytes_view_t{snapshot_key})).ok() ||
      !batch.Delete(detail::to_slice(bytes_view_t{sync_key})).ok()) {
    ledgersync::common::critical("Failed staging discard of snapshot {}",
                                 snapshot_id);
  }

  auto prefix_string = make_string(bytes_view_t{chunk_prefix});
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    if (!batch.Delete(iterator->key()).ok()) {
      ledgersync::common::critical("failed deleting chunk during discard");
    }
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    ledgersync::common::critical("failed scanning chunks of snapshot {}: {}",
                                 snapshot_id, iterator->status().ToString());
  }

  write(batch, "snapshot discard");
  spdlog::info("Discarded snapshot {} and sync progress {}", snapshot_id,
               sync_id);
}

void storage<rocksdb_storage_tag>::save_wallet_sync_record(
    const wallet_state_sync_record& record) const {
  auto encoder = detail::encoder_t{};
  auto row_key =
      key::make_wallet_sync_record_key(record.session_id(), record.peer_id());
  auto encoded = encoder.encode(record);
  put_raw(bytes_view_t{row_key}, bytes_view_t{encoded});
}

std::optional<wallet_state_sync_record>
storage<rocksdb_storage_tag>::load_wallet_sync_record(
    const session_id_t& session_id,
    const peer_id_t& peer_id) const {
  auto row_key = key::make_wallet_sync_record_key(session_id, peer_id);
  auto raw = get_raw(bytes_view_t{row_key});
  if (!raw) {
    return std::nullopt;
  }
  auto encoder = detail::encoder_t{};
  auto decoded = encoder.try_decode<wallet_state_sync_record>(
      detail::to_bytes_view(*raw));
  if (!decoded) {
    spdlog::warn("Failed decoding wallet sync record for session {}",
                 to_hex(bytes_view_t{session_id}));
  }
  return decoded;
}

std::vector<wallet_state_sync_record>
storage<rocksdb_storage_tag>::list_wallet_sync_records(
    const session_id_t& session_id) const {
  auto prefix = key::make_wallet_sync_session_prefix(session_id);
  auto encoder = detail::encoder_t{};
  auto records = std::vector<wallet_state_sync_record>{};
  for (const auto& [raw_key, raw_value] : list_by_prefix(bytes_view_t{prefix})) {
    auto record =
        encoder.try_decode<wallet_state_sync_record>(bytes_view_t{raw_value});
    if (!record) {
      spdlog::warn("Skipping undecodable wallet sync row for session {}",
                   to_hex(bytes_view_t{session_id}));
      continue;
    }
    records.push_back(std::move(*record));
  }
  return records;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const bytes_view_t& prefix) const {
  ensure_open();

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string = make_string(prefix);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    ledgersync::common::critical("failed scanning RocksDB prefix: {}",
                                 iterator->status().ToString());
  }
  return entries;
}

}  // namespace ledgersync::storage
