#pragma once
#include <agora/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace agora::storage {

using key_value_entry_t =
    std::pair<agora::schema::bytes_t, agora::schema::bytes_t>;

/// Writes and deletions staged for one commit batch.
struct write_set final {
  std::vector<key_value_entry_t> entries;
  std::vector<agora::schema::bytes_t> erased;
};

/// Last committed consensus checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  agora::schema::hash32_t state_root;
  agora::schema::timestamp_t block_time{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const agora::schema::bytes_view_t& key) const;

  /// Raw value at key, or std::nullopt when missing.
  std::optional<agora::schema::bytes_t> get_bytes(
      const agora::schema::bytes_view_t& key) const;

  /// Load the most recent committed checkpoint.
  std::optional<committed_state> load_committed_state() const;

  /// Return all key-value pairs that share the provided key prefix, ordered
  /// by key bytes.
  std::vector<key_value_entry_t> list_by_prefix(
      const agora::schema::bytes_view_t& prefix) const;

  /// Atomically write entries, delete erased keys, and record the new
  /// committed checkpoint.
  void commit_batch(const std::vector<key_value_entry_t>& entries,
                    const committed_state& state,
                    const std::vector<agora::schema::bytes_t>& erased = {})
      const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace agora::storage
