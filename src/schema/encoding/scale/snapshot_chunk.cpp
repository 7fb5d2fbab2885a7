#include <ledgersync/schema/encoding/scale/snapshot_chunk.hpp>

#include <utility>

namespace ledgersync::schema {

void encode(const snapshot_chunk& o, ::scale::Encoder& encoder) {
  encode(o.snapshot_id(), encoder);
  encode(o.data(), encoder);
  encode(o.starting_block_number(), encoder);
  encode(o.ending_block_number(), encoder);
}

void decode(snapshot_chunk& o, ::scale::Decoder& decoder) {
  auto snapshot_id = snapshot_id_t{};
  auto data = std::vector<bytes_t>{};
  auto starting_block_number = block_number_t{};
  auto ending_block_number = block_number_t{};
  decode(snapshot_id, decoder);
  decode(data, decoder);
  decode(starting_block_number, decoder);
  decode(ending_block_number, decoder);
  o = snapshot_chunk{snapshot_id, std::move(data), starting_block_number,
                     ending_block_number};
}

}  // namespace ledgersync::schema
