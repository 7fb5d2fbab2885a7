#include <ledgersync/schema/encoding/scale/snapshot_sync.hpp>

namespace ledgersync::schema {

void encode(const snapshot_sync& o, ::scale::Encoder& encoder) {
  encode(o.height(), encoder);
  encode(o.total_chunks(), encoder);
  encode(o.last_applied_chunk_index(), encoder);
  encode(o.snapshot_hash(), encoder);
  encode(o.format(), encoder);
}

void decode(snapshot_sync& o, ::scale::Decoder& decoder) {
  auto height = uint64_t{};
  auto total_chunks = uint64_t{};
  auto last_applied_chunk_index = chunk_index_t{};
  auto snapshot_hash = hash32_t{};
  auto format = uint64_t{};
  decode(height, decoder);
  decode(total_chunks, decoder);
  decode(last_applied_chunk_index, decoder);
  decode(snapshot_hash, decoder);
  decode(format, decoder);

  o = snapshot_sync{height, snapshot_hash, format, total_chunks};
  o.set_last_applied_chunk_index(last_applied_chunk_index);
}

}  // namespace ledgersync::schema
