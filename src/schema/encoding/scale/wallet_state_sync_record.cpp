#include <ledgersync/schema/encoding/scale/wallet_state_sync_record.hpp>

#include <tuple>
#include <utility>

namespace ledgersync::schema {

// Entries travel as (block, payload) tuples.
void encode(const wallet_state_sync_record& o, ::scale::Encoder& encoder) {
  auto entries = std::vector<std::tuple<block_number_t, bytes_t>>{};
  entries.reserve(o.entries().size());
  for (const auto& entry : o.entries()) {
    entries.emplace_back(entry.block, entry.data);
  }
  encode(o.session_id(), encoder);
  encode(entries, encoder);
  encode(o.chunks_count(), encoder);
  encode(o.peer_id(), encoder);
}

void decode(wallet_state_sync_record& o, ::scale::Decoder& decoder) {
  auto session_id = session_id_t{};
  auto entries = std::vector<std::tuple<block_number_t, bytes_t>>{};
  auto chunks_count = uint64_t{};
  auto peer_id = peer_id_t{};
  decode(session_id, decoder);
  decode(entries, decoder);
  decode(chunks_count, decoder);
  decode(peer_id, decoder);

  auto pairs = std::vector<wallet_sync_pair_t>{};
  pairs.reserve(entries.size());
  for (auto& [block, data] : entries) {
    pairs.emplace_back(block, std::move(data));
  }
  o = wallet_state_sync_record{peer_id, session_id, chunks_count,
                               std::move(pairs)};
}

}  // namespace ledgersync::schema
