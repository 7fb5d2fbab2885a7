#include <ledgersync/schema/encoding/scale/encoder.hpp>
#include <gtest/gtest.h>
#include <ledgersync/testing/common.hpp>

#include <vector>

namespace {

using encoder_t = ledgersync::schema::encoding::encoder<
    ledgersync::schema::encoding::scale_encoder_tag>;
using ledgersync::schema::bytes_t;

template <typename T>
T round_trip(const T& value) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(value);
  return encoder.decode<T>(encoded);
}

}  // namespace

TEST(encoding_types, snapshot_chunk_round_trips) {
  auto chunk = ledgersync::schema::snapshot_chunk{4, 100, bytes_t{1, 2}};
  chunk.append(bytes_t{}, 101);
  chunk.append(bytes_t(300, 0x5A), 104);
  EXPECT_EQ(round_trip(chunk), chunk);
}

TEST(encoding_types, snapshot_round_trip_restores_membership) {
  auto value = ledgersync::schema::snapshot{100, 12000,
                                            ledgersync::testing::make_hash(7)};
  value.add_chunk_id_if_absent(1);
  value.add_chunk_id_if_absent(2);
  value.add_block_id_if_absent(1001);

  auto decoded = round_trip(value);
  EXPECT_EQ(decoded, value);
  EXPECT_EQ(decoded.hash(), value.hash());
  EXPECT_TRUE(decoded.contains_chunk_id(2));
  EXPECT_FALSE(decoded.add_block_id_if_absent(1001));
}

TEST(encoding_types, snapshot_layout_is_stable) {
  auto value =
      ledgersync::schema::snapshot{1, 2, ledgersync::schema::make_zero_hash()};
  value.add_chunk_id(3);
  auto encoded = encoder_t{}.encode(value);

  // id, height, compact(1) + chunk id, compact(0), block hash
  ASSERT_EQ(encoded.size(), 8u + 8u + 1u + 8u + 1u + 32u);
  EXPECT_EQ(encoded[0], 0x01);
  EXPECT_EQ(encoded[8], 0x02);
  EXPECT_EQ(encoded[16], 0x04);
  EXPECT_EQ(encoded[17], 0x03);
  EXPECT_EQ(encoded[25], 0x00);
}

TEST(encoding_types, snapshot_sync_round_trips) {
  auto progress = ledgersync::schema::snapshot_sync{
      12000, ledgersync::testing::make_hash(9), 1, 8};
  progress.set_last_applied_chunk_index(3);
  EXPECT_EQ(round_trip(progress), progress);
}

TEST(encoding_types, wallet_state_sync_record_round_trips) {
  auto record = ledgersync::schema::wallet_state_sync_record{
      ledgersync::testing::make_peer(3), ledgersync::testing::make_hash(4), 2};
  record.append(bytes_t{1, 2, 3}, 100);
  record.append(bytes_t{4}, 101);

  auto decoded = round_trip(record);
  EXPECT_EQ(decoded, record);
  EXPECT_EQ(decoded.hash(), record.hash());
  EXPECT_TRUE(decoded.is_complete());
}

TEST(encoding_types, runtime_version_round_trips) {
  auto version = ledgersync::schema::runtime_version{.major = 3, .minor = 7};
  auto encoded = encoder_t{}.encode(version);
  EXPECT_EQ(encoded, (bytes_t{0x03, 0x00, 0x07, 0x00}));
  EXPECT_EQ(round_trip(version), version);
}

TEST(encoding_types, vote_encodes_as_single_byte) {
  auto encoder = encoder_t{};
  EXPECT_EQ(encoder.encode(ledgersync::schema::vote_t::absent), bytes_t{0x00});
  EXPECT_EQ(encoder.encode(ledgersync::schema::vote_t::nay), bytes_t{0x02});
  EXPECT_EQ(round_trip(ledgersync::schema::vote_t::aye),
            ledgersync::schema::vote_t::aye);
}

TEST(encoding_types, try_decode_rejects_truncated_input) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(ledgersync::schema::snapshot_sync{
      1, ledgersync::testing::make_hash(1), 1, 1});
  encoded.resize(encoded.size() - 1);
  EXPECT_FALSE(
      encoder.try_decode<ledgersync::schema::snapshot_sync>(encoded).has_value());
}

TEST(encoding_types, try_decode_rejects_unknown_vote) {
  auto encoder = encoder_t{};
  EXPECT_FALSE(encoder.try_decode<ledgersync::schema::vote_t>(bytes_t{0x07})
                   .has_value());
}
