#pragma once
#include <ledgersync/schema/snapshot.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ledgersync::schema {

void encode(const snapshot& o, ::scale::Encoder& encoder);
void decode(snapshot& o, ::scale::Decoder& decoder);

}  // namespace ledgersync::schema
