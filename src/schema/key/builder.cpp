#include <ledgersync/schema/key/builder.hpp>
#include <iterator>

namespace ledgersync::schema::key {

builder& builder::write(const std::string_view& str) {
  auto raw = reinterpret_cast<const uint8_t*>(str.data());
  data.insert(std::end(data), raw, raw + str.size());
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  data.insert(std::end(data), std::begin(bytes), std::end(bytes));
  return *this;
}

}  // namespace ledgersync::schema::key
