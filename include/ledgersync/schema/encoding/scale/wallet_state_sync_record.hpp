#pragma once
#include <ledgersync/schema/wallet_state_sync_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ledgersync::schema {

void encode(const wallet_state_sync_record& o, ::scale::Encoder& encoder);
void decode(wallet_state_sync_record& o, ::scale::Decoder& decoder);

}  // namespace ledgersync::schema
