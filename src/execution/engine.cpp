#include <spdlog/spdlog.h>
#include <agora/blake3/hash.hpp>
#include <agora/crosschain/envelope_codec.hpp>
#include <agora/crosschain/router.hpp>
#include <agora/crypto/verify.hpp>
#include <agora/execution/engine.hpp>
#include <agora/governance/administration.hpp>
#include <agora/governance/call_context.hpp>
#include <agora/governance/dao_registry.hpp>
#include <agora/governance/fee_ledger.hpp>
#include <agora/governance/finalization_controller.hpp>
#include <agora/governance/parameters.hpp>
#include <agora/governance/proposal_store.hpp>
#include <agora/governance/vote_aggregator.hpp>
#include <agora/schema/encoding/scale/encoder.hpp>
#include <agora/schema/key/engine_keys.hpp>
#include <algorithm>
#include <iterator>
#include <limits>
#include <tuple>
#include <utility>

using namespace agora::schema;

namespace {

using encoder_t = agora::schema::encoding::encoder<
    agora::schema::encoding::scale_encoder_tag>;

constexpr auto kCheckTxCodespace = std::string_view{"agora.checktx"};
constexpr auto kFinalizeCodespace = std::string_view{"agora.finalize"};
constexpr auto kQueryCodespace = std::string_view{"agora.query"};
// Upper bound on entries (or heights, for history) a range query may span.
constexpr auto kMaxQueryRange = uint64_t{1000};

agora::schema::hash32_t fold_state_root(const agora::schema::hash32_t& seed,
                                        const agora::schema::bytes_t& tx,
                                        uint64_t height,
                                        uint32_t index) {
  auto encoder = encoder_t{};
  auto suffix = encoder.encode(std::tuple{height, index});
  return agora::blake3::hasher{}
      .update(bytes_view_t{seed})
      .update(bytes_view_t{tx})
      .update(bytes_view_t{suffix})
      .finalize();
}

std::optional<agora::schema::transaction_t> decode_transaction(
    encoder_t& encoder,
    const agora::schema::bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto tx = encoder.try_decode<agora::schema::transaction_t>(raw_tx);
  if (!tx) {
    error = "undecodable transaction";
  }
  return tx;
}

transaction_result_t make_error_result(const transaction_error_code code,
                                       const std::string_view codespace,
                                       std::string info = {}) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

std::string_view operation_name(const transaction_payload_t& payload) {
  return std::visit(
      overloaded{
          [](const register_dao_t&) { return std::string_view{"register_dao"}; },
          [](const set_minimum_tokens_t&) {
            return std::string_view{"set_minimum_tokens"};
          },
          [](const set_creation_fee_t&) {
            return std::string_view{"set_creation_fee"};
          },
          [](const create_proposal_t&) {
            return std::string_view{"create_proposal"};
          },
          [](const cast_vote_t&) { return std::string_view{"cast_vote"}; },
          [](const finalize_proposal_t&) {
            return std::string_view{"finalize_proposal"};
          },
          [](const send_cross_chain_t&) {
            return std::string_view{"send_cross_chain"};
          },
          [](const deliver_cross_chain_t&) {
            return std::string_view{"deliver_cross_chain"};
          },
          [](const upsert_whitelist_t&) {
            return std::string_view{"upsert_whitelist"};
          },
          [](const upsert_token_balance_t&) {
            return std::string_view{"upsert_token_balance"};
          },
          [](const upsert_route_t&) { return std::string_view{"upsert_route"}; },
          [](const set_dispatch_fee_t&) {
            return std::string_view{"set_dispatch_fee"};
          },
          [](const withdraw_fees_t&) {
            return std::string_view{"withdraw_fees"};
          }},
      payload);
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const bytes_view_t& key,
                                const int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.key = make_bytes(key);
  result.height = height;
  result.codespace = std::string{kQueryCodespace};
  return result;
}

/// Indexes within a height are dense from zero, so each height stops at the
/// first missing entry.
std::vector<history_entry_t> collect_history(
    const agora::execution::state_view& state,
    const uint64_t from_height,
    const uint64_t to_height) {
  auto entries = std::vector<history_entry_t>{};
  for (auto height = from_height; height <= to_height; ++height) {
    for (auto index = uint32_t{0};; ++index) {
      auto entry = state.get<history_entry_t>(
          key::make_history_key(state.encoder(), height, index));
      if (!entry) {
        break;
      }
      entries.push_back(std::move(*entry));
    }
    if (height == std::numeric_limits<uint64_t>::max()) {
      break;
    }
  }
  return entries;
}

}  // namespace

namespace agora::execution {

engine::engine(encoder_t& encoder,
               agora::storage::storage<agora::storage::rocksdb_storage_tag>&
                   storage,
               engine_options options)
    : encoder_{encoder},
      storage_{storage},
      state_{encoder, storage},
      require_strict_crypto_{options.require_strict_crypto},
      signature_verifier_{agora::crypto::verify_signature},
      oracle_{std::make_shared<agora::governance::state_membership_oracle>(
          state_)},
      transport_{std::make_shared<agora::crosschain::outbox_transport>(
          state_,
          agora::crosschain::envelope_codec{encoder_})} {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state();
  initialize_genesis(options);
  if (!require_strict_crypto_) {
    spdlog::warn("Strict crypto disabled; signatures are not verified");
  } else if (!agora::crypto::available()) {
    spdlog::warn("OpenSSL lacks ed25519 or secp256k1 support");
  }
  spdlog::info("Governance engine ready at height {}", last_committed_height_);
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    last_committed_block_time_ = committed->block_time;
  }
  current_block_time_ = last_committed_block_time_;
}

void engine::initialize_genesis(const engine_options& options) {
  auto committed = state_view{encoder_, storage_};
  auto existing = committed.get<governance_parameters_t>(
      key::make_parameters_key(encoder_));
  if (existing) {
    chain_id_ = existing->chain_id;
    if (existing->chain_id != options.chain_id) {
      spdlog::warn("Configured chain id differs from persisted chain id; "
                   "using persisted value");
    }
    return;
  }

  chain_id_ = options.chain_id;
  agora::governance::save_parameters(
      state_, governance_parameters_t{.administrator = options.administrator,
                                      .chain_id = options.chain_id,
                                      .receiver = options.receiver,
                                      .creation_fee = options.creation_fee,
                                      .dispatch_fee = options.dispatch_fee});
  auto writes = state_.drain();
  storage_.commit_batch(
      writes.entries,
      agora::storage::committed_state{.height = last_committed_height_,
                                      .state_root = last_committed_state_root_,
                                      .block_time = last_committed_block_time_},
      writes.erased);
  spdlog::info("Wrote genesis parameters");
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

void engine::set_membership_oracle(
    std::shared_ptr<agora::governance::membership_oracle> oracle) {
  auto lock = std::scoped_lock{mutex_};
  oracle_ = std::move(oracle);
}

void engine::set_message_transport(
    std::shared_ptr<agora::crosschain::message_transport> transport) {
  auto lock = std::scoped_lock{mutex_};
  transport_ = std::move(transport);
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    const bytes_view_t& raw_tx,
    const std::string_view codespace,
    const state_view& state) const {
  static_cast<void>(raw_tx);
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version, codespace,
        "expected version 1");
  }
  if (tx.chain_id != chain_id_) {
    return make_error_result(transaction_error_code::invalid_chain_id,
                             codespace);
  }
  auto expected_nonce =
      state.get<uint64_t>(key::make_nonce_key(encoder_, tx.signer))
          .value_or(1);
  if (tx.nonce != expected_nonce) {
    return make_error_result(
        transaction_error_code::invalid_nonce, codespace,
        fmt::format("expected nonce {}", expected_nonce));
  }
  if (require_strict_crypto_) {
    if (std::holds_alternative<named_signer_t>(tx.signer)) {
      return make_error_result(transaction_error_code::invalid_signature_type,
                               codespace,
                               "named signers require strict crypto off");
    }
    auto signature_matches =
        (std::holds_alternative<ed25519_signer_id>(tx.signer) &&
         std::holds_alternative<ed25519_signature_t>(tx.signature)) ||
        (std::holds_alternative<secp256k1_signer_id>(tx.signer) &&
         std::holds_alternative<secp256k1_signature_t>(tx.signature));
    if (!signature_matches) {
      return make_error_result(transaction_error_code::invalid_signature_type,
                               codespace);
    }
    auto payload = agora::execution::signing_payload(encoder_, tx);
    if (!signature_verifier_ ||
        !signature_verifier_(bytes_view_t{payload}, tx.signer,
                             tx.signature)) {
      return make_error_result(
          transaction_error_code::signature_verification_failed, codespace);
    }
  }
  return transaction_result_t{};
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto tx = decode_transaction(encoder_, raw_tx, decode_error);
  if (!tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             kCheckTxCodespace, decode_error);
  }
  auto committed = state_view{encoder_, storage_};
  auto result = validate_transaction(*tx, raw_tx, kCheckTxCodespace, committed);
  if (result.code == 0) {
    result.gas_wanted = 1000;
  }
  return result;
}

transaction_result_t engine::execute_operation(const transaction_t& tx) {
  auto result = transaction_result_t{};
  auto context =
      agora::governance::call_context{.caller = agora::crypto::address_of(
                                          tx.signer),
                                      .now = current_block_time_,
                                      .events = result.events};

  auto fees = agora::governance::fee_ledger{state_};
  auto registry = agora::governance::dao_registry{state_, fees};
  auto proposals = agora::governance::proposal_store{state_, registry};
  auto votes =
      agora::governance::vote_aggregator{proposals, registry, *oracle_};
  auto finalization =
      agora::governance::finalization_controller{proposals, registry};
  auto administration = agora::governance::administration{state_};
  auto codec = agora::crosschain::envelope_codec{encoder_};
  auto router = agora::crosschain::router{
      state_, codec,         *transport_, proposals,     registry,
      votes,  finalization, fees,        administration};

  auto status = std::visit(
      overloaded{
          [&](const register_dao_t& value) {
            return registry.register_dao(context, value);
          },
          [&](const set_minimum_tokens_t& value) {
            return registry.set_minimum_tokens(context, value);
          },
          [&](const set_creation_fee_t& value) {
            return registry.set_creation_fee(context, value);
          },
          [&](const create_proposal_t& value) {
            return proposals.create(context, value);
          },
          [&](const cast_vote_t& value) {
            return votes.apply_vote(context, value.proposal_id, context.caller,
                                    value.weight, local_source_t{});
          },
          [&](const finalize_proposal_t& value) {
            return finalization.finalize(context, value.proposal_id);
          },
          [&](const send_cross_chain_t& value) {
            return router.send(context, value);
          },
          [&](const deliver_cross_chain_t& value) {
            return router.receive(context, value);
          },
          [&](const upsert_whitelist_t& value) {
            return administration.upsert_whitelist(context, value);
          },
          [&](const upsert_token_balance_t& value) {
            return administration.upsert_token_balance(context, value);
          },
          [&](const upsert_route_t& value) {
            return administration.upsert_route(context, value);
          },
          [&](const set_dispatch_fee_t& value) {
            return administration.set_dispatch_fee(context, value);
          },
          [&](const withdraw_fees_t&) { return fees.withdraw(context); }},
      tx.payload);

  auto name = operation_name(tx.payload);
  if (status) {
    return make_error_result(*status, kFinalizeCodespace,
                             fmt::format("{} rejected", name));
  }
  result.info = fmt::format("{} accepted", name);
  result.gas_wanted = 1000;
  result.gas_used = 750;
  return result;
}

block_result_t engine::finalize_block(
    const uint64_t height,
    const timestamp_t block_time,
    const std::vector<agora::schema::bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    spdlog::warn("Discarding uncommitted block at height {}", pending_height_);
    static_cast<void>(state_.drain());
  }

  current_block_time_ = block_time;
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  auto rolling_root = last_committed_state_root_;
  for (auto i = uint32_t{0}; i < txs.size(); ++i) {
    auto raw_tx = bytes_view_t{txs[i]};
    auto decode_error = std::string{};
    auto tx = decode_transaction(encoder_, raw_tx, decode_error);

    auto tx_result = transaction_result_t{};
    if (!tx) {
      tx_result = make_error_result(transaction_error_code::invalid_transaction,
                                    kFinalizeCodespace, decode_error);
    } else {
      state_.begin();
      tx_result = validate_transaction(*tx, raw_tx, kFinalizeCodespace, state_);
      if (tx_result.code == 0) {
        tx_result = execute_operation(*tx);
      }
      if (tx_result.code == 0) {
        state_.put(key::make_nonce_key(encoder_, tx->signer), tx->nonce + 1);
        state_.commit();
        rolling_root = fold_state_root(rolling_root, txs[i], height, i);
      } else {
        state_.rollback();
        spdlog::debug("Rejected tx {} at height {}: {} ({})", i, height,
                      tx_result.log, tx_result.info);
      }
    }

    state_.put(key::make_history_key(encoder_, height, i),
               history_entry_t{.height = height,
                               .index = i,
                               .code = tx_result.code,
                               .tx = txs[i]});
    if (tx_result.code == 0) {
      persist_events(height, i, tx_result);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  pending_block_time_ = block_time;
  result.state_root = rolling_root;
  spdlog::info("Finalized block {} with {} tx(s)", height, txs.size());
  return result;
}

void engine::persist_events(const uint64_t height,
                            const uint32_t tx_index,
                            const transaction_result_t& result) {
  auto sequence_key = key::make_event_sequence_key(encoder_);
  auto next_id = state_.get<uint64_t>(sequence_key).value_or(1);
  for (const auto& event : result.events) {
    state_.put(key::make_event_key(encoder_, next_id),
               event_record_t{.event_id = next_id,
                              .height = height,
                              .tx_index = tx_index,
                              .event = event});
    ++next_id;
  }
  state_.put(sequence_key, next_id);
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    auto writes = state_.drain();
    storage_.commit_batch(
        writes.entries,
        agora::storage::committed_state{.height = pending_height_,
                                        .state_root = pending_state_root_,
                                        .block_time = pending_block_time_},
        writes.erased);
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    last_committed_block_time_ = pending_block_time_;
    pending_height_ = 0;
    spdlog::info("Committed height {}", last_committed_height_);
  }

  auto result = commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

std::vector<history_entry_t> engine::history(const uint64_t from_height,
                                             const uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  auto committed = state_view{encoder_, storage_};
  return collect_history(committed, from_height, to_height);
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto committed = state_view{encoder_, storage_};
  auto height = last_committed_height_;

  auto ok = [&](bytes_t value) {
    auto result = query_result_t{};
    result.key = make_bytes(data);
    result.value = std::move(value);
    result.height = height;
    result.codespace = std::string{kQueryCodespace};
    return result;
  };
  auto invalid_key = [&] {
    return make_query_error(query_error_code::invalid_key,
                            "invalid query key", data, height);
  };
  auto not_found = [&] {
    return make_query_error(query_error_code::not_found, "not found", data,
                            height);
  };
  auto decode_range = [&]() -> std::optional<std::pair<uint64_t, uint64_t>> {
    auto decoded = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!decoded || std::get<1>(*decoded) < std::get<0>(*decoded)) {
      return std::nullopt;
    }
    return std::pair{std::get<0>(*decoded), std::get<1>(*decoded)};
  };
  auto range_too_large = [&](const std::pair<uint64_t, uint64_t>& range) {
    return range.second - range.first >= kMaxQueryRange;
  };

  if (path == "/engine/info") {
    auto result = app_info_t{};
    result.last_block_height = last_committed_height_;
    result.last_block_state_root = last_committed_state_root_;
    return ok(encoder_.encode(result));
  }
  if (path == "/state/parameters") {
    return ok(encoder_.encode(agora::governance::load_parameters(committed)));
  }
  if (path == "/state/fees") {
    return ok(encoder_.encode(agora::governance::fee_ledger{committed}.current()));
  }
  if (path == "/state/dao") {
    auto dao_id = encoder_.try_decode<dao_id_t>(data);
    if (!dao_id) {
      return invalid_key();
    }
    auto record = committed.get<dao_record_t>(key::make_dao_key(encoder_, *dao_id));
    if (!record) {
      return not_found();
    }
    return ok(encoder_.encode(*record));
  }
  if (path == "/state/route") {
    auto chain = encoder_.try_decode<chain_id_t>(data);
    if (!chain) {
      return invalid_key();
    }
    auto route = agora::governance::administration{committed}.route(*chain);
    if (!route) {
      return not_found();
    }
    return ok(encoder_.encode(*route));
  }
  if (path == "/state/whitelist") {
    auto address = encoder_.try_decode<address_t>(data);
    if (!address) {
      return invalid_key();
    }
    auto oracle = agora::governance::state_membership_oracle{committed};
    return ok(encoder_.encode(oracle.is_whitelisted(*address)));
  }
  if (path == "/state/balance") {
    auto decoded = encoder_.try_decode<std::tuple<token_id_t, address_t>>(data);
    if (!decoded) {
      return invalid_key();
    }
    auto oracle = agora::governance::state_membership_oracle{committed};
    return ok(encoder_.encode(
        oracle.balance_of(std::get<0>(*decoded), std::get<1>(*decoded))));
  }

  auto fees = agora::governance::fee_ledger{committed};
  auto registry = agora::governance::dao_registry{committed, fees};
  auto proposals = agora::governance::proposal_store{committed, registry};
  if (path == "/state/proposal") {
    auto proposal_id = encoder_.try_decode<proposal_id_t>(data);
    if (!proposal_id) {
      return invalid_key();
    }
    auto snapshot =
        proposals.snapshot(*proposal_id, last_committed_block_time_);
    if (!snapshot) {
      return not_found();
    }
    return ok(encoder_.encode(*snapshot));
  }
  if (path == "/state/tally") {
    auto decoded =
        encoder_.try_decode<std::tuple<proposal_id_t, address_t>>(data);
    if (!decoded) {
      return invalid_key();
    }
    if (!proposals.get(std::get<0>(*decoded))) {
      return not_found();
    }
    return ok(encoder_.encode(
        proposals.tally(std::get<0>(*decoded), std::get<1>(*decoded))));
  }
  if (path == "/state/tallies") {
    auto proposal_id = encoder_.try_decode<proposal_id_t>(data);
    if (!proposal_id) {
      return invalid_key();
    }
    if (!proposals.get(*proposal_id)) {
      return not_found();
    }
    return ok(encoder_.encode(proposals.tallies(*proposal_id)));
  }
  if (path == "/outbox/range" || path == "/history/range" ||
      path == "/events/range") {
    auto range = decode_range();
    if (!range) {
      return invalid_key();
    }
    if (range_too_large(*range)) {
      return make_query_error(query_error_code::range_too_large,
                              "range too large", data, height);
    }
    if (path == "/outbox/range") {
      return ok(encoder_.encode(agora::crosschain::outbox_transport::range(
          committed, range->first, range->second)));
    }
    if (path == "/history/range") {
      return ok(encoder_.encode(
          collect_history(committed, range->first, range->second)));
    }
    auto events = std::vector<event_record_t>{};
    for (auto id = std::max<uint64_t>(range->first, 1); id <= range->second;
         ++id) {
      auto event = committed.get<event_record_t>(key::make_event_key(encoder_, id));
      if (!event) {
        break;
      }
      events.push_back(std::move(*event));
    }
    return ok(encoder_.encode(events));
  }

  return make_query_error(query_error_code::unsupported_path,
                          "unsupported query path", data, height);
}

}  // namespace agora::execution
