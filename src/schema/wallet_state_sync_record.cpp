#include <ledgersync/crypto/sha256.hpp>
#include <ledgersync/schema/wallet_state_sync_record.hpp>

#include <algorithm>

namespace ledgersync::schema {

wallet_state_sync_record::wallet_state_sync_record(
    const peer_id_t& peer_id,
    const session_id_t& session_id,
    const uint64_t chunks_count,
    std::optional<std::vector<wallet_sync_pair_t>> pairs)
    : session_id_{session_id}, chunks_count_{chunks_count}, peer_id_{peer_id} {
  if (!pairs) {
    return;
  }
  entries_.reserve(pairs->size());
  for (auto& [block, data] : *pairs) {
    entries_.push_back(wallet_sync_entry{.block = block, .data = std::move(data)});
  }
}

void wallet_state_sync_record::set_peer_id(const peer_id_t& peer_id) {
  peer_id_ = peer_id;
}

void wallet_state_sync_record::set_session_id(const session_id_t& session_id) {
  session_id_ = session_id;
}

void wallet_state_sync_record::set_chunks_count(const uint64_t chunks_count) {
  chunks_count_ = chunks_count;
}

bool wallet_state_sync_record::add_if_absent(bytes_t data,
                                             const block_number_t block) {
  if (std::ranges::any_of(entries_, [&](const wallet_sync_entry& entry) {
        return entry.data == data;
      })) {
    return false;
  }
  if (std::ranges::any_of(entries_, [&](const wallet_sync_entry& entry) {
        return entry.block == block;
      })) {
    return false;
  }
  entries_.push_back(wallet_sync_entry{.block = block, .data = std::move(data)});
  return true;
}

bool wallet_state_sync_record::append(bytes_t data,
                                      const block_number_t block) {
  return add_if_absent(std::move(data), block);
}

std::size_t wallet_state_sync_record::append(
    std::vector<bytes_t> data,
    const std::vector<block_number_t>& blocks) {
  auto added = std::size_t{0};
  const auto count = std::min(data.size(), blocks.size());
  for (std::size_t i = 0; i < count; ++i) {
    if (add_if_absent(std::move(data[i]), blocks[i])) {
      ++added;
    }
  }
  return added;
}

std::set<wallet_sync_pair_t> wallet_state_sync_record::to_pair_set() const {
  auto pairs = std::set<wallet_sync_pair_t>{};
  for (const auto& entry : entries_) {
    pairs.emplace(entry.block, entry.data);
  }
  return pairs;
}

std::size_t wallet_state_sync_record::size() const {
  // Both identifiers are accounted at 32 bytes, matching persisted sizing.
  auto total = sizeof(session_id_t) * 2;
  for (const auto& entry : entries_) {
    total += entry.data.size() + sizeof(block_number_t);
  }
  return total;
}

hash32_t wallet_state_sync_record::hash() const {
  auto hasher = ledgersync::crypto::sha256_hasher{};
  hasher.update(bytes_view_t{peer_id_});
  hasher.update(bytes_view_t{session_id_});
  for (const auto& entry : entries_) {
    hasher.update(bytes_view_t{entry.data});
  }
  return hasher.finalize();
}

bool wallet_state_sync_record::is_complete() const {
  return entries_.size() >= chunks_count_;
}

}  // namespace ledgersync::schema
