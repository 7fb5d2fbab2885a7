#pragma once
#include <ledgersync/schema/runtime_version.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ledgersync::schema {

void encode(const runtime_version& o, ::scale::Encoder& encoder);
void decode(runtime_version& o, ::scale::Decoder& decoder);

}  // namespace ledgersync::schema
