#include <gtest/gtest.h>
#include <agora/schema/encoding/scale/encoder.hpp>
#include <agora/schema/key/engine_keys.hpp>
#include <agora/storage/rocksdb/storage.hpp>
#include <agora/testing/execution_harness.hpp>

#include <optional>
#include <string>
#include <vector>

namespace {

using agora::testing::make_hash;
using agora::testing::scale_encoder_t;
using agora::testing::temp_directory;

agora::storage::storage<agora::storage::rocksdb_storage_tag> open(
    const temp_directory& directory) {
  return agora::storage::make_storage<agora::storage::rocksdb_storage_tag>(
      directory.path);
}

}  // namespace

TEST(storage, fresh_database_has_no_committed_state) {
  auto directory = temp_directory{"agora_storage_fresh"};
  auto storage = open(directory);
  EXPECT_FALSE(storage.load_committed_state().has_value());
}

TEST(storage, commit_batch_persists_entries_with_checkpoint) {
  auto directory = temp_directory{"agora_storage_commit"};
  auto encoder = scale_encoder_t{};
  auto key = agora::schema::key::make_dao_key(encoder, make_hash(1));
  {
    auto storage = open(directory);
    storage.commit_batch(
        {{key, encoder.encode(uint64_t{77})}},
        agora::storage::committed_state{
            .height = 5, .state_root = make_hash(9), .block_time = 1234});
  }

  auto storage = open(directory);
  auto committed = storage.load_committed_state();
  ASSERT_TRUE(committed.has_value());
  EXPECT_EQ(committed->height, 5);
  EXPECT_EQ(committed->state_root, make_hash(9));
  EXPECT_EQ(committed->block_time, 1234u);

  auto value =
      storage.get<uint64_t>(encoder, agora::schema::bytes_view_t{key});
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 77u);
}

TEST(storage, get_returns_nullopt_for_missing_keys) {
  auto directory = temp_directory{"agora_storage_missing"};
  auto encoder = scale_encoder_t{};
  auto storage = open(directory);
  auto key = agora::schema::key::make_dao_key(encoder, make_hash(2));
  EXPECT_FALSE(storage.get_bytes(agora::schema::bytes_view_t{key}).has_value());
}

TEST(storage, list_by_prefix_returns_only_matching_keys_in_order) {
  auto directory = temp_directory{"agora_storage_prefix"};
  auto encoder = scale_encoder_t{};
  auto storage = open(directory);
  auto proposal = make_hash(3);
  auto first = agora::schema::key::make_tally_key(encoder, proposal, make_hash(1));
  auto second =
      agora::schema::key::make_tally_key(encoder, proposal, make_hash(2));
  auto other =
      agora::schema::key::make_tally_key(encoder, make_hash(4), make_hash(1));
  storage.commit_batch({{second, encoder.encode(uint64_t{2})},
                        {other, encoder.encode(uint64_t{3})},
                        {first, encoder.encode(uint64_t{1})}},
                       agora::storage::committed_state{.height = 1});

  auto prefix = agora::schema::key::make_tally_prefix_key(encoder, proposal);
  auto rows = storage.list_by_prefix(agora::schema::bytes_view_t{prefix});
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].first, first);
  EXPECT_EQ(rows[1].first, second);
}

TEST(storage, commit_batch_deletes_erased_keys) {
  auto directory = temp_directory{"agora_storage_erase"};
  auto encoder = scale_encoder_t{};
  auto storage = open(directory);
  auto key = agora::schema::key::make_dao_key(encoder, make_hash(5));
  storage.commit_batch({{key, encoder.encode(uint64_t{1})}},
                       agora::storage::committed_state{.height = 1});
  ASSERT_TRUE(storage.get_bytes(agora::schema::bytes_view_t{key}).has_value());

  storage.commit_batch({}, agora::storage::committed_state{.height = 2},
                       {key});
  EXPECT_FALSE(storage.get_bytes(agora::schema::bytes_view_t{key}).has_value());
  EXPECT_EQ(storage.load_committed_state()->height, 2);
}
