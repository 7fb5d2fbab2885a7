#pragma once

#include <ledgersync/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: vote.
// Activation voting: a validator's signal on a proposed protocol upgrade,
// carried in block proposals. Validators opt in explicitly; abstention is the
// default.
namespace ledgersync::schema {

// Value-initialized votes are `absent`.
enum class vote_t : uint8_t {
  absent = 0,
  aye = 1,
  nay = 2,
};

inline constexpr auto kVoteMappings = std::array{
    std::pair<std::string_view, vote_t>{"aye", vote_t::aye},
    std::pair<std::string_view, vote_t>{"nay", vote_t::nay},
    std::pair<std::string_view, vote_t>{"absent", vote_t::absent}};

template <>
inline std::optional<vote_t> try_from_string<vote_t>(
    const std::string_view value) {
  return from_string(value, kVoteMappings);
}

inline constexpr std::string_view to_string(const vote_t value) {
  return to_string(value, kVoteMappings, "unknown");
}

}  // namespace ledgersync::schema
