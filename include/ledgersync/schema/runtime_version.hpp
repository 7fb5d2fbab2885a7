#pragma once

#include <compare>
#include <cstdint>
#include <string>

// Schema type: runtime version.
// Activation voting: protocol capability level. Major is bumped for hard
// forks, minor for non-breaking changes; ordering is major first, then minor.
namespace ledgersync::schema {

struct runtime_version final {
  uint16_t major{};
  uint16_t minor{};

  auto operator<=>(const runtime_version&) const = default;
};

inline std::string to_string(const runtime_version& version) {
  return std::to_string(version.major) + "." + std::to_string(version.minor);
}

}  // namespace ledgersync::schema
