#include <ledgersync/schema/wallet_state_sync_record.hpp>
#include <gtest/gtest.h>
#include <ledgersync/testing/common.hpp>

#include <vector>

namespace {

using ledgersync::schema::bytes_t;
using ledgersync::schema::wallet_state_sync_record;

wallet_state_sync_record make_record(const uint64_t chunks_count = 2) {
  return wallet_state_sync_record{ledgersync::testing::make_peer(1),
                                  ledgersync::testing::make_hash(2),
                                  chunks_count};
}

}  // namespace

TEST(wallet_state_sync_record, add_if_absent_rejects_repeated_payload) {
  auto record = make_record();
  EXPECT_TRUE(record.add_if_absent(bytes_t{1, 2, 3}, 100));
  EXPECT_FALSE(record.add_if_absent(bytes_t{1, 2, 3}, 200));
  ASSERT_EQ(record.entries().size(), 1u);
  EXPECT_EQ(record.entries()[0].block, 100u);
}

TEST(wallet_state_sync_record, add_if_absent_rejects_repeated_block) {
  auto record = make_record();
  EXPECT_TRUE(record.add_if_absent(bytes_t{1}, 100));
  EXPECT_FALSE(record.add_if_absent(bytes_t{2}, 100));
  EXPECT_EQ(record.entries().size(), 1u);
}

TEST(wallet_state_sync_record, batch_append_zips_to_shorter_input) {
  auto record = make_record();
  auto added = record.append(std::vector<bytes_t>{{1}, {2}, {3}},
                             std::vector<uint64_t>{10, 20});
  EXPECT_EQ(added, 2u);
  auto blocks = std::vector<uint64_t>{};
  for (auto block : record.blocks()) {
    blocks.push_back(block);
  }
  EXPECT_EQ(blocks, (std::vector<uint64_t>{10, 20}));
}

TEST(wallet_state_sync_record, batch_append_skips_duplicates) {
  auto record = make_record();
  auto added = record.append(std::vector<bytes_t>{{1}, {1}, {2}},
                             std::vector<uint64_t>{10, 11, 10});
  EXPECT_EQ(added, 1u);
}

TEST(wallet_state_sync_record, seed_pairs_are_kept_verbatim) {
  auto record = wallet_state_sync_record{
      ledgersync::testing::make_peer(1), ledgersync::testing::make_hash(2), 3,
      std::vector<ledgersync::schema::wallet_sync_pair_t>{
          {1, bytes_t{'a'}}, {2, bytes_t{'b'}}, {1, bytes_t{'a'}}}};
  EXPECT_EQ(record.entries().size(), 3u);
  EXPECT_EQ(record.to_pair_set().size(), 2u);
}

TEST(wallet_state_sync_record, size_counts_identifiers_payloads_and_blocks) {
  auto record = make_record();
  EXPECT_EQ(record.size(), 64u);
  EXPECT_TRUE(record.append(bytes_t{9, 9}, 5));
  EXPECT_EQ(record.size(), 74u);
}

TEST(wallet_state_sync_record, hash_ignores_block_numbers) {
  auto first = make_record();
  auto second = make_record();
  first.append(bytes_t{1, 2}, 10);
  second.append(bytes_t{1, 2}, 99);
  EXPECT_EQ(first.hash(), second.hash());

  second.append(bytes_t{3}, 100);
  EXPECT_NE(first.hash(), second.hash());
}

TEST(wallet_state_sync_record, hash_covers_identities) {
  auto first = make_record();
  auto second = make_record();
  second.set_peer_id(ledgersync::testing::make_peer(9));
  EXPECT_NE(first.hash(), second.hash());
  second = make_record();
  second.set_session_id(ledgersync::testing::make_hash(9));
  EXPECT_NE(first.hash(), second.hash());
}

TEST(wallet_state_sync_record, completes_at_expected_entry_count) {
  auto record = make_record(2);
  EXPECT_FALSE(record.is_complete());
  record.append(bytes_t{1}, 1);
  EXPECT_FALSE(record.is_complete());
  record.append(bytes_t{2}, 2);
  EXPECT_TRUE(record.is_complete());
}
