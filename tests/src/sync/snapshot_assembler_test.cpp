#include <ledgersync/sync/snapshot_assembler.hpp>
#include <ledgersync/storage/rocksdb/storage.hpp>
#include <gtest/gtest.h>
#include <ledgersync/testing/common.hpp>

#include <limits>
#include <vector>

namespace {

using ledgersync::schema::apply_snapshot_chunk_result;
using ledgersync::schema::bytes_t;
using ledgersync::schema::snapshot;
using ledgersync::schema::snapshot_chunk;
using ledgersync::schema::snapshot_sync;
using ledgersync::sync::snapshot_assembler;

constexpr auto kSnapshotId = uint64_t{100};
constexpr auto kHeight = uint64_t{12000};

snapshot make_empty_snapshot() {
  return snapshot{kSnapshotId, kHeight, ledgersync::testing::make_hash(40)};
}

snapshot_chunk make_chunk(const uint64_t start, const uint64_t end) {
  auto chunk = snapshot_chunk{kSnapshotId, start, bytes_t{1}};
  for (auto block = start + 1; block <= end; ++block) {
    chunk.append(bytes_t{static_cast<uint8_t>(block)}, block);
  }
  return chunk;
}

// Hash of the snapshot the two chunks below assemble into.
ledgersync::schema::hash32_t expected_hash() {
  auto target = make_empty_snapshot();
  target.add_chunk_id(1);
  target.add_chunk_id(2);
  for (auto block = uint64_t{1}; block <= 6; ++block) {
    target.add_block_id(block);
  }
  return target.hash();
}

}  // namespace

TEST(snapshot_assembler, assembles_and_verifies_snapshot) {
  auto assembler = snapshot_assembler{
      make_empty_snapshot(), snapshot_sync{kHeight, expected_hash(), 1, 2}};

  EXPECT_EQ(assembler.apply_chunk(1, make_chunk(1, 3)),
            apply_snapshot_chunk_result::accept);
  EXPECT_FALSE(assembler.is_complete());
  EXPECT_EQ(assembler.progress().last_applied_chunk_index(), 1u);

  EXPECT_EQ(assembler.apply_chunk(2, make_chunk(4, 6)),
            apply_snapshot_chunk_result::accept);
  EXPECT_TRUE(assembler.is_complete());
  EXPECT_TRUE(assembler.is_verified());
  EXPECT_EQ(assembler.snapshot().chunk_ids(), (std::vector<uint64_t>{1, 2}));
  EXPECT_EQ(assembler.snapshot().block_ids(),
            (std::vector<uint64_t>{1, 2, 3, 4, 5, 6}));
}

TEST(snapshot_assembler, duplicate_chunk_does_not_advance_progress) {
  auto assembler = snapshot_assembler{
      make_empty_snapshot(), snapshot_sync{kHeight, expected_hash(), 1, 2}};
  EXPECT_EQ(assembler.apply_chunk(1, make_chunk(1, 3)),
            apply_snapshot_chunk_result::accept);
  EXPECT_EQ(assembler.apply_chunk(1, make_chunk(1, 3)),
            apply_snapshot_chunk_result::accept);
  EXPECT_EQ(assembler.progress().last_applied_chunk_index(), 1u);
  EXPECT_EQ(assembler.snapshot().block_ids().size(), 3u);
}

TEST(snapshot_assembler, chunk_of_another_snapshot_is_retried) {
  auto assembler = snapshot_assembler{
      make_empty_snapshot(), snapshot_sync{kHeight, expected_hash(), 1, 2}};
  auto foreign = snapshot_chunk{kSnapshotId + 1, 1, bytes_t{1}};
  EXPECT_EQ(assembler.apply_chunk(1, foreign),
            apply_snapshot_chunk_result::retry);
  EXPECT_EQ(assembler.progress().last_applied_chunk_index(), 0u);
  EXPECT_TRUE(assembler.snapshot().chunk_ids().empty());
}

TEST(snapshot_assembler, hash_mismatch_rejects_snapshot) {
  auto assembler = snapshot_assembler{
      make_empty_snapshot(),
      snapshot_sync{kHeight, ledgersync::testing::make_hash(1), 1, 1}};
  EXPECT_EQ(assembler.apply_chunk(1, make_chunk(1, 3)),
            apply_snapshot_chunk_result::reject_snapshot);
  EXPECT_TRUE(assembler.is_complete());
  EXPECT_FALSE(assembler.is_verified());
}

TEST(snapshot_assembler, extra_chunk_after_completion_aborts) {
  auto assembler = snapshot_assembler{
      make_empty_snapshot(), snapshot_sync{kHeight, expected_hash(), 1, 2}};
  assembler.apply_chunk(1, make_chunk(1, 3));
  assembler.apply_chunk(2, make_chunk(4, 6));
  EXPECT_EQ(assembler.apply_chunk(3, make_chunk(7, 8)),
            apply_snapshot_chunk_result::abort);
  EXPECT_EQ(assembler.progress().last_applied_chunk_index(), 2u);
}

TEST(snapshot_assembler, overlapping_ranges_register_blocks_once) {
  auto target = make_empty_snapshot();
  target.add_chunk_id(1);
  target.add_chunk_id(2);
  for (auto block = uint64_t{1}; block <= 4; ++block) {
    target.add_block_id(block);
  }
  auto assembler = snapshot_assembler{
      make_empty_snapshot(), snapshot_sync{kHeight, target.hash(), 1, 2}};
  assembler.apply_chunk(1, make_chunk(1, 3));
  EXPECT_EQ(assembler.apply_chunk(2, make_chunk(2, 4)),
            apply_snapshot_chunk_result::accept);
  EXPECT_TRUE(assembler.is_verified());
}

TEST(snapshot_assembler, resumes_from_persisted_progress) {
  auto db = ledgersync::testing::make_db_path("ledgersync_assembler_resume");
  {
    auto storage = ledgersync::storage::make_storage<
        ledgersync::storage::rocksdb_storage_tag>(db);
    {
      auto assembler = snapshot_assembler{
          make_empty_snapshot(), snapshot_sync{kHeight, expected_hash(), 1, 2}};
      auto chunk = make_chunk(1, 3);
      ASSERT_EQ(assembler.apply_chunk(1, chunk),
                apply_snapshot_chunk_result::accept);
      ASSERT_TRUE(storage.commit_chunk(7, assembler.progress(),
                                       assembler.snapshot(), 1, chunk));
    }

    auto persisted_snapshot = storage.load_snapshot(kSnapshotId);
    auto persisted_progress = storage.load_snapshot_sync(7);
    ASSERT_TRUE(persisted_snapshot.has_value());
    ASSERT_TRUE(persisted_progress.has_value());

    auto resumed =
        snapshot_assembler{*persisted_snapshot, *persisted_progress};
    EXPECT_EQ(resumed.apply_chunk(1, make_chunk(1, 3)),
              apply_snapshot_chunk_result::accept);
    EXPECT_EQ(resumed.progress().last_applied_chunk_index(), 1u);
    EXPECT_EQ(resumed.apply_chunk(2, make_chunk(4, 6)),
              apply_snapshot_chunk_result::accept);
    EXPECT_TRUE(resumed.is_verified());
  }
  ledgersync::testing::remove_path(db);
}

TEST(snapshot_assembler, range_wider_than_payloads_is_retried) {
  auto assembler = snapshot_assembler{
      make_empty_snapshot(), snapshot_sync{kHeight, expected_hash(), 1, 2}};
  auto chunk = snapshot_chunk{kSnapshotId, 0, bytes_t{1}};
  chunk.append(bytes_t{}, 5'000'000);

  EXPECT_EQ(assembler.apply_chunk(1, chunk),
            apply_snapshot_chunk_result::retry);
  EXPECT_TRUE(assembler.snapshot().chunk_ids().empty());
  EXPECT_TRUE(assembler.snapshot().block_ids().empty());
  EXPECT_EQ(assembler.progress().last_applied_chunk_index(), 0u);

  // The same chunk id is still accepted once a well-formed chunk arrives.
  EXPECT_EQ(assembler.apply_chunk(1, make_chunk(1, 3)),
            apply_snapshot_chunk_result::accept);
  EXPECT_EQ(assembler.snapshot().block_ids().size(), 3u);
}

TEST(snapshot_assembler, range_reaching_max_block_is_retried) {
  auto assembler = snapshot_assembler{
      make_empty_snapshot(), snapshot_sync{kHeight, expected_hash(), 1, 2}};
  auto chunk = snapshot_chunk{kSnapshotId, 0, bytes_t{1}};
  chunk.append(bytes_t{2}, std::numeric_limits<uint64_t>::max());
  EXPECT_EQ(assembler.apply_chunk(1, chunk),
            apply_snapshot_chunk_result::retry);
  EXPECT_TRUE(assembler.snapshot().block_ids().empty());
}

TEST(snapshot_assembler, inverted_range_registers_starting_block_only) {
  auto target = make_empty_snapshot();
  target.add_chunk_id(1);
  target.add_block_id(10);
  auto assembler = snapshot_assembler{
      make_empty_snapshot(), snapshot_sync{kHeight, target.hash(), 1, 1}};
  auto chunk = snapshot_chunk{kSnapshotId, 10, bytes_t{1}};
  chunk.append(bytes_t{2}, 4);
  ASSERT_FALSE(chunk.spans_valid_range());

  EXPECT_EQ(assembler.apply_chunk(1, chunk),
            apply_snapshot_chunk_result::accept);
  EXPECT_EQ(assembler.snapshot().block_ids(), (std::vector<uint64_t>{10}));
  EXPECT_EQ(assembler.progress().last_applied_chunk_index(), 1u);
  EXPECT_TRUE(assembler.is_verified());
}

TEST(snapshot_assembler, results_have_names) {
  EXPECT_EQ(to_string(apply_snapshot_chunk_result::accept), "accept");
  EXPECT_EQ(to_string(apply_snapshot_chunk_result::abort), "abort");
  EXPECT_EQ(to_string(apply_snapshot_chunk_result::retry), "retry");
  EXPECT_EQ(to_string(apply_snapshot_chunk_result::reject_snapshot),
            "reject_snapshot");
  EXPECT_EQ(to_string(static_cast<apply_snapshot_chunk_result>(9)), "unknown");
}
