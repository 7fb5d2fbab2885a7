#pragma once
#include <ledgersync/schema/snapshot_chunk.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Lives in the schema namespace: the SCALE codec finds these through ADL.
namespace ledgersync::schema {

void encode(const snapshot_chunk& o, ::scale::Encoder& encoder);
void decode(snapshot_chunk& o, ::scale::Decoder& decoder);

}  // namespace ledgersync::schema
