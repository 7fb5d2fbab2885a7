#include <ledgersync/schema/snapshot_chunk.hpp>

#include <numeric>
#include <utility>

namespace ledgersync::schema {

snapshot_chunk::snapshot_chunk(const snapshot_id_t snapshot_id,
                               const block_number_t starting_block_number,
                               bytes_t data)
    : snapshot_id_{snapshot_id},
      starting_block_number_{starting_block_number},
      ending_block_number_{starting_block_number} {
  data_.push_back(std::move(data));
}

snapshot_chunk::snapshot_chunk(const snapshot_id_t snapshot_id,
                               std::vector<bytes_t> data,
                               const block_number_t starting_block_number,
                               const block_number_t ending_block_number)
    : snapshot_id_{snapshot_id},
      data_{std::move(data)},
      starting_block_number_{starting_block_number},
      ending_block_number_{ending_block_number} {}

void snapshot_chunk::append(bytes_t data,
                            const block_number_t ending_block_number) {
  data_.push_back(std::move(data));
  ending_block_number_ = ending_block_number;
}

std::size_t snapshot_chunk::size() const {
  return std::accumulate(std::begin(data_), std::end(data_),
                         sizeof(snapshot_id_t),
                         [](const std::size_t total, const bytes_t& payload) {
                           return total + payload.size();
                         });
}

bool snapshot_chunk::spans_valid_range() const {
  return ending_block_number_ >= starting_block_number_;
}

}  // namespace ledgersync::schema
