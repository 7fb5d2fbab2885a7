#pragma once
#include <array>
#include <boost/uuid/uuid.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ledgersync::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using hash64_t = std::array<uint8_t, 64>;

using block_number_t = uint64_t;
using snapshot_id_t = uint64_t;
using snapshot_sync_id_t = uint64_t;
using chunk_id_t = uint64_t;
using chunk_index_t = uint64_t;

// Wallet state sync identities: peers are 512-bit node keys, sessions are
// UUIDs widened to 256 bits.
using peer_id_t = hash64_t;
using session_id_t = hash32_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::optional<hash64_t> try_make_hash64(const std::string_view& hex);

session_id_t make_session_id(const boost::uuids::uuid& uuid);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

}  // namespace ledgersync::schema
