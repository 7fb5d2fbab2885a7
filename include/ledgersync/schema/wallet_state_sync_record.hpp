#pragma once

#include <ledgersync/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <ranges>
#include <set>
#include <span>
#include <utility>
#include <vector>

// Schema type: wallet state sync record.
// Wallet reconciliation: block-tagged payloads received from one peer during
// a wallet state sync session.
namespace ledgersync::schema {

struct wallet_sync_entry final {
  block_number_t block{};
  bytes_t data;

  bool operator==(const wallet_sync_entry&) const = default;
};

using wallet_sync_pair_t = std::pair<block_number_t, bytes_t>;

class wallet_state_sync_record final {
 public:
  wallet_state_sync_record() = default;

  /// Seed pairs are stored as given, in order, without deduplication.
  wallet_state_sync_record(
      const peer_id_t& peer_id,
      const session_id_t& session_id,
      uint64_t chunks_count,
      std::optional<std::vector<wallet_sync_pair_t>> pairs = std::nullopt);

  void set_peer_id(const peer_id_t& peer_id);
  void set_session_id(const session_id_t& session_id);
  void set_chunks_count(uint64_t chunks_count);

  /// Store `data` for `block` unless the payload is already held for any
  /// block, or the block already carries any payload. The two checks are
  /// independent. Returns false, leaving the record untouched, on rejection.
  bool add_if_absent(bytes_t data, block_number_t block);

  bool append(bytes_t data, block_number_t block);

  /// Pair payloads with blocks by position and insert each through
  /// add_if_absent. Extra elements of the longer input are ignored.
  /// Returns how many pairs were stored.
  std::size_t append(std::vector<bytes_t> data,
                     const std::vector<block_number_t>& blocks);

  /// Arrival-ordered (block, payload) entries. Reflects the current state on
  /// every call.
  std::span<const wallet_sync_entry> entries() const { return entries_; }

  auto payloads() const {
    return entries_ | std::views::transform(&wallet_sync_entry::data);
  }

  auto blocks() const {
    return entries_ | std::views::transform(&wallet_sync_entry::block);
  }

  /// Distinct (block, payload) pairs, independent of arrival order.
  std::set<wallet_sync_pair_t> to_pair_set() const;

  /// Session and peer identifiers (32 bytes each, peer included), payload
  /// bytes, and eight bytes per block number.
  std::size_t size() const;

  /// SHA-256 over peer id, session id and every payload in arrival order.
  /// Block numbers do not contribute.
  hash32_t hash() const;

  bool is_complete() const;

  const peer_id_t& peer_id() const { return peer_id_; }
  const session_id_t& session_id() const { return session_id_; }
  uint64_t chunks_count() const { return chunks_count_; }

  bool operator==(const wallet_state_sync_record&) const = default;

 private:
  session_id_t session_id_{};
  std::vector<wallet_sync_entry> entries_;
  uint64_t chunks_count_{};
  peer_id_t peer_id_{};
};

}  // namespace ledgersync::schema
