#pragma once

#include <ledgersync/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace ledgersync::testing {

inline ledgersync::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = ledgersync::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline ledgersync::schema::peer_id_t make_peer(const uint8_t seed) {
  auto peer = ledgersync::schema::peer_id_t{};
  peer[0] = seed;
  peer[63] = static_cast<uint8_t>(~seed);
  return peer;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace ledgersync::testing
