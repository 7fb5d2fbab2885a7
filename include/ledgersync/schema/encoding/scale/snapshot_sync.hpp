#pragma once
#include <ledgersync/schema/snapshot_sync.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ledgersync::schema {

void encode(const snapshot_sync& o, ::scale::Encoder& encoder);
void decode(snapshot_sync& o, ::scale::Decoder& decoder);

}  // namespace ledgersync::schema
