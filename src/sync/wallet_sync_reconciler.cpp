#include <ledgersync/sync/wallet_sync_reconciler.hpp>

#include <spdlog/spdlog.h>

#include <set>
#include <utility>

using namespace ledgersync::schema;

namespace ledgersync::sync {

wallet_sync_reconciler::wallet_sync_reconciler(const session_id_t& session_id,
                                               const uint64_t chunks_count)
    : session_id_{session_id}, chunks_count_{chunks_count} {}

bool wallet_sync_reconciler::record(const peer_id_t& peer,
                                    const block_number_t block,
                                    bytes_t payload) {
  auto it = records_.find(peer);
  if (it == std::end(records_)) {
    it = records_
             .emplace(peer, wallet_state_sync_record{peer, session_id_,
                                                     chunks_count_})
             .first;
    spdlog::debug("Wallet sync session {}: new peer {}",
                  to_hex(bytes_view_t{session_id_}),
                  to_hex(bytes_view_t{peer}));
  }
  auto added = it->second.add_if_absent(std::move(payload), block);
  if (!added) {
    spdlog::debug("Wallet sync session {}: duplicate payload or block {} "
                  "from peer {}",
                  to_hex(bytes_view_t{session_id_}), block,
                  to_hex(bytes_view_t{peer}));
  }
  return added;
}

bool wallet_sync_reconciler::adopt(wallet_state_sync_record record) {
  if (record.session_id() != session_id_) {
    spdlog::warn("Refusing wallet sync record of session {} in session {}",
                 to_hex(bytes_view_t{record.session_id()}),
                 to_hex(bytes_view_t{session_id_}));
    return false;
  }
  auto peer = record.peer_id();
  records_.insert_or_assign(peer, std::move(record));
  return true;
}

std::optional<wallet_state_sync_record> wallet_sync_reconciler::find(
    const peer_id_t& peer) const {
  auto it = records_.find(peer);
  if (it == std::end(records_)) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<peer_id_t> wallet_sync_reconciler::converged_peers() const {
  auto groups = std::map<std::set<wallet_sync_pair_t>, std::vector<peer_id_t>>{};
  for (const auto& [peer, record] : records_) {
    if (!record.is_complete()) {
      continue;
    }
    groups[record.to_pair_set()].push_back(peer);
  }

  auto best = std::vector<peer_id_t>{};
  for (auto& [content, peers] : groups) {
    if (peers.size() > best.size()) {
      best = std::move(peers);
    }
  }
  return best;
}

bool wallet_sync_reconciler::has_converged(const std::size_t quorum) const {
  return quorum > 0 && converged_peers().size() >= quorum;
}

}  // namespace ledgersync::sync
