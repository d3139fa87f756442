#pragma once

#include <agora/crosschain/message_transport.hpp>
#include <agora/execution/signature_verifier.hpp>
#include <agora/execution/state_view.hpp>
#include <agora/governance/membership_oracle.hpp>
#include <agora/schema/app_info.hpp>
#include <agora/schema/block_result.hpp>
#include <agora/schema/commit_result.hpp>
#include <agora/schema/encoding/encoder.hpp>
#include <agora/schema/event_record.hpp>
#include <agora/schema/history_entry.hpp>
#include <agora/schema/primitives.hpp>
#include <agora/schema/query_result.hpp>
#include <agora/schema/transaction.hpp>
#include <agora/schema/transaction_error_code.hpp>
#include <agora/schema/transaction_result.hpp>
#include <agora/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agora::execution {

/// Genesis configuration.  Applied when storage holds no parameters record;
/// afterwards the persisted record wins.
struct engine_options final {
  agora::schema::chain_id_t chain_id{};
  agora::schema::address_t administrator{};
  /// Receiver address remote chains must put on envelopes for this chain.
  agora::schema::address_t receiver{};
  agora::schema::amount_t creation_fee{};
  agora::schema::amount_t dispatch_fee{};
  bool require_strict_crypto{true};
};

/// Deterministic governance state machine used by the ABCI server.
///
/// The engine validates transactions, executes payload operations against a
/// block overlay, persists state/history/events at commit, and answers read
/// path queries from committed state.
class engine final {
 public:
  explicit engine(
      agora::schema::encoding::encoder<
          agora::schema::encoding::scale_encoder_tag>& encoder,
      agora::storage::storage<agora::storage::rocksdb_storage_tag>& storage,
      engine_options options = {});

  /// Admit a transaction for mempool inclusion (CheckTx semantics).
  ///
  /// Performs decode + validation checks only; does not mutate application
  /// state.
  agora::schema::transaction_result_t check_transaction(
      const agora::schema::bytes_view_t& raw_tx);

  /// Execute a candidate block at `block_time` and compute its state root.
  ///
  /// Transactions run in order; each one commits atomically into the block
  /// or is rejected without effect.  Per-tx results are returned either way.
  agora::schema::block_result_t finalize_block(
      uint64_t height,
      agora::schema::timestamp_t block_time,
      const std::vector<agora::schema::bytes_t>& txs);

  /// Persist the finalized block in one storage batch.
  agora::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state_root).
  agora::schema::app_info_t info() const;

  /// Execute a deterministic read-path query by route.
  agora::schema::query_result_t query(std::string_view path,
                                      const agora::schema::bytes_view_t& data);

  /// Return committed history entries in the inclusive height range.
  std::vector<agora::schema::history_entry_t> history(
      uint64_t from_height,
      uint64_t to_height) const;

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  /// Replace the whitelist/balance oracle; the default reads chain state.
  void set_membership_oracle(
      std::shared_ptr<agora::governance::membership_oracle> oracle);

  /// Replace the outbound transport; the default appends to the outbox.
  void set_message_transport(
      std::shared_ptr<agora::crosschain::message_transport> transport);

 private:
  agora::schema::transaction_result_t execute_operation(
      const agora::schema::transaction_t& tx);

  /// Validate transaction envelope, signature, and nonce.
  agora::schema::transaction_result_t validate_transaction(
      const agora::schema::transaction_t& tx,
      const agora::schema::bytes_view_t& raw_tx,
      std::string_view codespace,
      const state_view& state) const;

  void persist_events(uint64_t height,
                      uint32_t tx_index,
                      const agora::schema::transaction_result_t& result);

  void initialize_genesis(const engine_options& options);
  void load_persisted_state();

  mutable std::mutex mutex_;
  agora::schema::encoding::encoder<agora::schema::encoding::scale_encoder_tag>&
      encoder_;
  agora::storage::storage<agora::storage::rocksdb_storage_tag>& storage_;
  state_view state_;
  int64_t last_committed_height_{};
  agora::schema::hash32_t last_committed_state_root_{};
  agora::schema::timestamp_t last_committed_block_time_{};
  int64_t pending_height_{};
  agora::schema::hash32_t pending_state_root_{};
  agora::schema::timestamp_t pending_block_time_{};
  agora::schema::timestamp_t current_block_time_{};
  agora::schema::chain_id_t chain_id_{};
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
  std::shared_ptr<agora::governance::membership_oracle> oracle_;
  std::shared_ptr<agora::crosschain::message_transport> transport_;
};

}  // namespace agora::execution
