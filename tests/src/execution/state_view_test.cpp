#include <gtest/gtest.h>
#include <agora/execution/state_view.hpp>
#include <agora/schema/key/engine_keys.hpp>
#include <agora/testing/execution_harness.hpp>

using agora::testing::make_hash;

namespace {

agora::schema::bytes_t tally_key(agora::testing::state_fixture& fixture,
                                 const uint8_t voter) {
  return agora::schema::key::make_tally_key(fixture.encoder, make_hash(1),
                                            make_hash(voter));
}

}  // namespace

TEST(state_view, reads_see_transaction_then_block_writes) {
  auto fixture = agora::testing::state_fixture{"agora_state_view_reads"};
  auto key = tally_key(fixture, 2);
  fixture.state.put(key, uint64_t{1});

  fixture.state.begin();
  fixture.state.put(key, uint64_t{2});
  EXPECT_EQ(fixture.state.get<uint64_t>(key), uint64_t{2});
  fixture.state.commit();
  EXPECT_EQ(fixture.state.get<uint64_t>(key), uint64_t{2});
}

TEST(state_view, rollback_discards_only_transaction_writes) {
  auto fixture = agora::testing::state_fixture{"agora_state_view_rollback"};
  auto kept = tally_key(fixture, 2);
  auto dropped = tally_key(fixture, 3);
  fixture.state.put(kept, uint64_t{5});

  fixture.state.begin();
  fixture.state.put(kept, uint64_t{6});
  fixture.state.put(dropped, uint64_t{7});
  fixture.state.rollback();

  EXPECT_EQ(fixture.state.get<uint64_t>(kept), uint64_t{5});
  EXPECT_FALSE(fixture.state.contains(dropped));
}

TEST(state_view, list_by_prefix_merges_storage_and_pending_writes) {
  auto fixture = agora::testing::state_fixture{"agora_state_view_prefix"};
  fixture.storage.commit_batch(
      {{tally_key(fixture, 2), fixture.encoder.encode(uint64_t{1})},
       {tally_key(fixture, 4), fixture.encoder.encode(uint64_t{1})}},
      agora::storage::committed_state{.height = 1});
  fixture.state.put(tally_key(fixture, 3), uint64_t{2});
  fixture.state.begin();
  fixture.state.put(tally_key(fixture, 4), uint64_t{9});

  auto prefix =
      agora::schema::key::make_tally_prefix_key(fixture.encoder, make_hash(1));
  auto rows = fixture.state.list_by_prefix(prefix);
  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(rows[0].first, tally_key(fixture, 2));
  EXPECT_EQ(rows[1].first, tally_key(fixture, 3));
  EXPECT_EQ(rows[2].first, tally_key(fixture, 4));
  EXPECT_EQ(fixture.encoder.decode<uint64_t>(
                agora::schema::bytes_view_t{rows[2].second}),
            9u);
  fixture.state.rollback();
}

TEST(state_view, drain_hands_over_block_writes_and_empties_overlay) {
  auto fixture = agora::testing::state_fixture{"agora_state_view_drain"};
  static_cast<void>(fixture.state.drain());
  auto key = tally_key(fixture, 2);
  fixture.state.put(key, uint64_t{3});

  auto writes = fixture.state.drain();
  ASSERT_EQ(writes.entries.size(), 1u);
  EXPECT_EQ(writes.entries[0].first, key);
  EXPECT_TRUE(writes.erased.empty());
  EXPECT_FALSE(fixture.state.contains(key));
}

TEST(state_view, erase_hides_committed_value_until_batch_deletes_it) {
  auto fixture = agora::testing::state_fixture{"agora_state_view_erase"};
  auto kept = tally_key(fixture, 2);
  auto removed = tally_key(fixture, 3);
  static_cast<void>(fixture.state.drain());
  fixture.storage.commit_batch(
      {{kept, fixture.encoder.encode(uint64_t{1})},
       {removed, fixture.encoder.encode(uint64_t{1})}},
      agora::storage::committed_state{.height = 1});

  fixture.state.begin();
  fixture.state.erase(removed);
  EXPECT_FALSE(fixture.state.contains(removed));
  fixture.state.rollback();
  EXPECT_TRUE(fixture.state.contains(removed));

  fixture.state.begin();
  fixture.state.erase(removed);
  fixture.state.commit();
  auto prefix =
      agora::schema::key::make_tally_prefix_key(fixture.encoder, make_hash(1));
  auto rows = fixture.state.list_by_prefix(prefix);
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].first, kept);

  auto writes = fixture.state.drain();
  EXPECT_TRUE(writes.entries.empty());
  ASSERT_EQ(writes.erased.size(), 1u);
  EXPECT_EQ(writes.erased[0], removed);
  fixture.storage.commit_batch(writes.entries,
                               agora::storage::committed_state{.height = 2},
                               writes.erased);
  EXPECT_FALSE(fixture.storage
                   .get_bytes(agora::schema::bytes_view_t{removed})
                   .has_value());
  EXPECT_TRUE(
      fixture.storage.get_bytes(agora::schema::bytes_view_t{kept}).has_value());
}
