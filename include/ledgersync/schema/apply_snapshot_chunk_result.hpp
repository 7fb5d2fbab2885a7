#pragma once

#include <ledgersync/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: apply snapshot chunk result.
// State sync outcome of handing one received chunk to the assembler.
namespace ledgersync::schema {

enum class apply_snapshot_chunk_result : uint8_t {
  accept = 0,
  abort = 1,
  retry = 2,
  reject_snapshot = 3,
};

inline constexpr auto kApplySnapshotChunkResultNames = std::array{
    enum_name_t<apply_snapshot_chunk_result>{
        "accept", apply_snapshot_chunk_result::accept},
    enum_name_t<apply_snapshot_chunk_result>{
        "abort", apply_snapshot_chunk_result::abort},
    enum_name_t<apply_snapshot_chunk_result>{
        "retry", apply_snapshot_chunk_result::retry},
    enum_name_t<apply_snapshot_chunk_result>{
        "reject_snapshot", apply_snapshot_chunk_result::reject_snapshot}};

inline constexpr std::string_view to_string(
    const apply_snapshot_chunk_result value) {
  return to_string(value, kApplySnapshotChunkResultNames, "unknown");
}

}  // namespace ledgersync::schema
