#include <ledgersync/schema/encoding/scale/snapshot.hpp>

#include <utility>

namespace ledgersync::schema {

void encode(const snapshot& o, ::scale::Encoder& encoder) {
  encode(o.id(), encoder);
  encode(o.height(), encoder);
  encode(o.chunk_ids(), encoder);
  encode(o.block_ids(), encoder);
  encode(o.block_hash(), encoder);
}

void decode(snapshot& o, ::scale::Decoder& decoder) {
  auto id = snapshot_id_t{};
  auto height = uint64_t{};
  auto chunk_ids = std::vector<chunk_id_t>{};
  auto block_ids = std::vector<block_number_t>{};
  auto block_hash = hash32_t{};
  decode(id, decoder);
  decode(height, decoder);
  decode(chunk_ids, decoder);
  decode(block_ids, decoder);
  decode(block_hash, decoder);

  o = snapshot{id, height, block_hash};
  o.set_chunk_ids(std::move(chunk_ids));
  o.set_block_ids(std::move(block_ids));
}

}  // namespace ledgersync::schema
