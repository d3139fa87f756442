#pragma once

#include <agora/schema/encoding/scale/encoder.hpp>
#include <agora/schema/primitives.hpp>
#include <agora/storage/rocksdb/storage.hpp>
#include <map>
#include <optional>
#include <vector>

namespace agora::execution {

/// Write overlay over committed storage.
///
/// Writes made between begin() and commit() form one transaction scope; a
/// rollback() discards them and leaves the block scope untouched.  The block
/// scope is handed to storage in one batch by the engine at commit time.
/// Reads see transaction writes, then block writes, then committed storage.
/// An erased key is held as an empty slot so it hides the committed value.
class state_view final {
 public:
  using encoder_t = agora::schema::encoding::encoder<
      agora::schema::encoding::scale_encoder_tag>;
  using storage_t =
      agora::storage::storage<agora::storage::rocksdb_storage_tag>;

  state_view(encoder_t& encoder, const storage_t& storage);

  template <typename T>
  std::optional<T> get(const agora::schema::bytes_t& key) const;

  template <typename T>
  void put(const agora::schema::bytes_t& key, const T& value);

  /// Remove key; the deletion reaches storage with the block batch.
  void erase(const agora::schema::bytes_t& key);

  bool contains(const agora::schema::bytes_t& key) const;

  /// Merged view of storage and pending writes under prefix, ordered by key.
  std::vector<agora::storage::key_value_entry_t> list_by_prefix(
      const agora::schema::bytes_t& prefix) const;

  void begin();
  void commit();
  void rollback();

  /// Pending block writes and deletions in key order; the overlay is left
  /// empty.
  agora::storage::write_set drain();

  encoder_t& encoder() const { return encoder_; }

 private:
  std::optional<agora::schema::bytes_t> lookup(
      const agora::schema::bytes_t& key) const;

  using overlay_t =
      std::map<agora::schema::bytes_t, std::optional<agora::schema::bytes_t>>;

  encoder_t& encoder_;
  const storage_t& storage_;
  overlay_t block_writes_;
  overlay_t tx_writes_;
  bool in_transaction_{false};
};

template <typename T>
std::optional<T> state_view::get(const agora::schema::bytes_t& key) const {
  auto raw = lookup(key);
  if (!raw) {
    return std::nullopt;
  }
  return encoder_.template decode<T>(agora::schema::bytes_view_t{*raw});
}

template <typename T>
void state_view::put(const agora::schema::bytes_t& key, const T& value) {
  auto& target = in_transaction_ ? tx_writes_ : block_writes_;
  target[key] = encoder_.encode(value);
}

}  // namespace agora::execution
