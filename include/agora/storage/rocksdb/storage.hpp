#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <agora/common/critical.hpp>
#include <agora/schema/encoding/scale/encoder.hpp>
#include <agora/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>
#include <tuple>

namespace agora::storage {

namespace detail {

using encoder_t = agora::schema::encoding::encoder<
    agora::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedHeightKey =
    std::string_view{"SYS|APP|COMMITTED_HEIGHT"};

inline agora::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const agora::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const agora::schema::bytes_view_t& key) const;

  std::optional<agora::schema::bytes_t> get_bytes(
      const agora::schema::bytes_view_t& key) const;

  std::optional<committed_state> load_committed_state() const;
  std::vector<key_value_entry_t> list_by_prefix(
      const agora::schema::bytes_view_t& prefix) const;
  void commit_batch(const std::vector<key_value_entry_t>& entries,
                    const committed_state& state,
                    const std::vector<agora::schema::bytes_t>& erased = {})
      const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<agora::schema::bytes_t>
storage<rocksdb_storage_tag>::get_bytes(
    const agora::schema::bytes_view_t& key) const {
  if (!database) {
    agora::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    agora::common::critical("Failed to get value from RocksDB: {}",
                            status.ToString());
  }
  return agora::schema::bytes_t{std::begin(value), std::end(value)};
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const agora::schema::bytes_view_t& key) const {
  auto value = get_bytes(key);
  if (!value) {
    return std::nullopt;
  }
  return encoder.template decode<T>(agora::schema::bytes_view_t{*value});
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = get_bytes(agora::schema::make_bytes_view(
      detail::kCommittedHeightKey));
  if (!raw) {
    return std::nullopt;
  }

  auto encoder = detail::encoder_t{};
  auto decoded = encoder.try_decode<std::tuple<
      int64_t, agora::schema::hash32_t, agora::schema::timestamp_t>>(*raw);
  if (!decoded.has_value()) {
    agora::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value()),
                         .block_time = std::get<2>(decoded.value())};
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const agora::schema::bytes_view_t& prefix) const {
  if (!database) {
    agora::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = detail::to_slice(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_slice);
       iterator->Valid() && iterator->key().starts_with(prefix_slice);
       iterator->Next()) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    agora::common::critical("RocksDB iteration failed: {}",
                            iterator->status().ToString());
  }
  return entries;
}

inline void storage<rocksdb_storage_tag>::commit_batch(
    const std::vector<key_value_entry_t>& entries,
    const committed_state& state,
    const std::vector<agora::schema::bytes_t>& erased) const {
  if (!database) {
    agora::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      agora::common::critical("failed staging key in commit batch");
    }
  }
  for (const auto& key : erased) {
    auto delete_status = batch.Delete(detail::to_slice(key));
    if (!delete_status.ok()) {
      agora::common::critical("failed staging deletion in commit batch");
    }
  }

  auto encoder = detail::encoder_t{};
  auto encoded_state = encoder.encode(
      std::tuple{state.height, state.state_root, state.block_time});
  auto state_status = batch.Put(
      std::string{detail::kCommittedHeightKey},
      ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(
                                   encoded_state.data()),
                               encoded_state.size()});
  if (!state_status.ok()) {
    agora::common::critical("failed staging committed state");
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    agora::common::critical("Failed to commit block at height {}: {}",
                            state.height, write_status.ToString());
  }
}

}  // namespace agora::storage
