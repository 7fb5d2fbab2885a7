#pragma once

#include <ledgersync/schema/primitives.hpp>
#include <ledgersync/schema/wallet_state_sync_record.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace ledgersync::sync {

/// Collects per-peer wallet state sync records for one session and detects
/// when peers agree on the same content.
class wallet_sync_reconciler final {
 public:
  wallet_sync_reconciler(const ledgersync::schema::session_id_t& session_id,
                         uint64_t chunks_count);

  /// Store a payload received from `peer`, creating its record on first
  /// contact. Returns false when the record rejected the pair as a duplicate.
  bool record(const ledgersync::schema::peer_id_t& peer,
              ledgersync::schema::block_number_t block,
              ledgersync::schema::bytes_t payload);

  /// Take over a persisted record. Rejected when it belongs to another
  /// session.
  bool adopt(ledgersync::schema::wallet_state_sync_record record);

  std::optional<ledgersync::schema::wallet_state_sync_record> find(
      const ledgersync::schema::peer_id_t& peer) const;

  /// Largest group of complete records holding identical (block, payload)
  /// sets, regardless of arrival order.
  std::vector<ledgersync::schema::peer_id_t> converged_peers() const;

  bool has_converged(std::size_t quorum) const;

  const ledgersync::schema::session_id_t& session_id() const {
    return session_id_;
  }
  std::size_t peer_count() const { return records_.size(); }

 private:
  ledgersync::schema::session_id_t session_id_;
  uint64_t chunks_count_{};
  std::map<ledgersync::schema::peer_id_t,
           ledgersync::schema::wallet_state_sync_record>
      records_;
};

}  // namespace ledgersync::sync
