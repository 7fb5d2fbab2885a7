#pragma once

#include <ledgersync/schema/primitives.hpp>
#include <cstddef>
#include <vector>

// Schema type: snapshot chunk.
// State sync unit of transfer: raw block payloads covering a contiguous
// block-number range of one snapshot, kept in arrival order.
namespace ledgersync::schema {

class snapshot_chunk final {
 public:
  snapshot_chunk() = default;

  /// Start a chunk with its first payload; the range covers one block.
  snapshot_chunk(snapshot_id_t snapshot_id,
                 block_number_t starting_block_number,
                 bytes_t data);

  /// Rebuild a chunk from persisted fields.
  snapshot_chunk(snapshot_id_t snapshot_id,
                 std::vector<bytes_t> data,
                 block_number_t starting_block_number,
                 block_number_t ending_block_number);

  /// Append a payload and move the range end to `ending_block_number`.
  ///
  /// The new end is taken as given; range ordering is the caller's contract.
  void append(bytes_t data, block_number_t ending_block_number);

  /// Identifier overhead (8 bytes) plus every payload length.
  std::size_t size() const;

  /// True while `ending >= starting`.
  bool spans_valid_range() const;

  snapshot_id_t snapshot_id() const { return snapshot_id_; }
  const std::vector<bytes_t>& data() const { return data_; }
  block_number_t starting_block_number() const {
    return starting_block_number_;
  }
  block_number_t ending_block_number() const { return ending_block_number_; }

  bool operator==(const snapshot_chunk&) const = default;

 private:
  snapshot_id_t snapshot_id_{};
  std::vector<bytes_t> data_;
  block_number_t starting_block_number_{};
  block_number_t ending_block_number_{};
};

}  // namespace ledgersync::schema
