#include <ledgersync/schema/encoding/scale/runtime_version.hpp>

namespace ledgersync::schema {

void encode(const runtime_version& o, ::scale::Encoder& encoder) {
  encode(o.major, encoder);
  encode(o.minor, encoder);
}

void decode(runtime_version& o, ::scale::Decoder& decoder) {
  decode(o.major, decoder);
  decode(o.minor, decoder);
}

}  // namespace ledgersync::schema
