#include <agora/common/critical.hpp>
#include <agora/execution/state_view.hpp>

#include <algorithm>
#include <iterator>

namespace agora::execution {

namespace {

bool has_prefix(const agora::schema::bytes_t& key,
                const agora::schema::bytes_t& prefix) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key));
}

void merge_prefix(
    const std::map<agora::schema::bytes_t,
                   std::optional<agora::schema::bytes_t>>& writes,
    const agora::schema::bytes_t& prefix,
    std::map<agora::schema::bytes_t, agora::schema::bytes_t>& merged) {
  for (auto it = writes.lower_bound(prefix);
       it != std::end(writes) && has_prefix(it->first, prefix); ++it) {
    if (it->second) {
      merged[it->first] = *it->second;
    } else {
      merged.erase(it->first);
    }
  }
}

}  // namespace

state_view::state_view(encoder_t& encoder, const storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

void state_view::erase(const agora::schema::bytes_t& key) {
  auto& target = in_transaction_ ? tx_writes_ : block_writes_;
  target[key] = std::nullopt;
}

bool state_view::contains(const agora::schema::bytes_t& key) const {
  return lookup(key).has_value();
}

std::optional<agora::schema::bytes_t> state_view::lookup(
    const agora::schema::bytes_t& key) const {
  if (in_transaction_) {
    if (auto it = tx_writes_.find(key); it != std::end(tx_writes_)) {
      return it->second;
    }
  }
  if (auto it = block_writes_.find(key); it != std::end(block_writes_)) {
    return it->second;
  }
  return storage_.get_bytes(agora::schema::bytes_view_t{key});
}

std::vector<agora::storage::key_value_entry_t> state_view::list_by_prefix(
    const agora::schema::bytes_t& prefix) const {
  auto merged = std::map<agora::schema::bytes_t, agora::schema::bytes_t>{};
  for (auto& [key, value] :
       storage_.list_by_prefix(agora::schema::bytes_view_t{prefix})) {
    merged.emplace(std::move(key), std::move(value));
  }
  merge_prefix(block_writes_, prefix, merged);
  if (in_transaction_) {
    merge_prefix(tx_writes_, prefix, merged);
  }
  return {std::make_move_iterator(std::begin(merged)),
          std::make_move_iterator(std::end(merged))};
}

void state_view::begin() {
  if (in_transaction_) {
    agora::common::critical("state_view transaction already open");
  }
  tx_writes_.clear();
  in_transaction_ = true;
}

void state_view::commit() {
  for (auto& [key, value] : tx_writes_) {
    block_writes_[key] = std::move(value);
  }
  tx_writes_.clear();
  in_transaction_ = false;
}

void state_view::rollback() {
  tx_writes_.clear();
  in_transaction_ = false;
}

agora::storage::write_set state_view::drain() {
  if (in_transaction_) {
    agora::common::critical("cannot drain state_view inside a transaction");
  }
  auto writes = agora::storage::write_set{};
  for (auto& [key, value] : block_writes_) {
    if (value) {
      writes.entries.emplace_back(key, std::move(*value));
    } else {
      writes.erased.push_back(key);
    }
  }
  block_writes_.clear();
  return writes;
}

}  // namespace agora::execution
