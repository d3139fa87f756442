#pragma once

#include <agora/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Canonical key prefixes and key builders for governance state, the outbox,
// history and events.
namespace agora::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kParametersKeyPrefix{
    "SYS|STATE|PARAMETERS|"};
inline constexpr std::string_view kFeeLedgerKeyPrefix{"SYS|STATE|FEES|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kDaoKeyPrefix{"SYS|STATE|DAO|"};
inline constexpr std::string_view kProposalKeyPrefix{"SYS|STATE|PROPOSAL|"};
inline constexpr std::string_view kTallyKeyPrefix{"SYS|STATE|TALLY|"};
inline constexpr std::string_view kAppliedMessageKeyPrefix{
    "SYS|STATE|APPLIED_MESSAGE|"};
inline constexpr std::string_view kWhitelistKeyPrefix{"SYS|STATE|WHITELIST|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kRouteKeyPrefix{"SYS|STATE|ROUTE|"};
inline constexpr std::string_view kOutboxSeqKeyPrefix{"SYS|STATE|OUTBOX_SEQ|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kOutboxPrefix{"SYS|OUTBOX|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

inline const std::array<std::string_view, 16> kEngineKeyspaces{
    kStatePrefix,          kParametersKeyPrefix,     kFeeLedgerKeyPrefix,
    kNonceKeyPrefix,       kDaoKeyPrefix,            kProposalKeyPrefix,
    kTallyKeyPrefix,       kAppliedMessageKeyPrefix, kWhitelistKeyPrefix,
    kBalanceKeyPrefix,     kRouteKeyPrefix,          kOutboxSeqKeyPrefix,
    kEventSeqKeyPrefix,    kOutboxPrefix,            kHistoryPrefix,
    kEventPrefix};

template <typename Encoder, typename T>
agora::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                         std::string_view prefix,
                                         const T& id) {
  // SCALE product types are encoded as concatenated field bytes, so this is
  // the encoding of tuple{prefix, id} and a shorter id tuple is a prefix.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
agora::schema::bytes_t make_parameters_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kParametersKeyPrefix,
                           std::string_view{"CURRENT"});
}

template <typename Encoder>
agora::schema::bytes_t make_fee_ledger_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kFeeLedgerKeyPrefix,
                           std::string_view{"CURRENT"});
}

template <typename Encoder>
agora::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const agora::schema::signer_id_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

template <typename Encoder>
agora::schema::bytes_t make_dao_key(Encoder& encoder,
                                    const agora::schema::dao_id_t& dao_id) {
  return make_prefixed_key(encoder, kDaoKeyPrefix, dao_id);
}

template <typename Encoder>
agora::schema::bytes_t make_proposal_key(
    Encoder& encoder,
    const agora::schema::proposal_id_t& proposal_id) {
  return make_prefixed_key(encoder, kProposalKeyPrefix, proposal_id);
}

template <typename Encoder>
agora::schema::bytes_t make_tally_key(
    Encoder& encoder,
    const agora::schema::proposal_id_t& proposal_id,
    const agora::schema::address_t& voter) {
  return make_prefixed_key(encoder, kTallyKeyPrefix,
                           std::tuple{proposal_id, voter});
}

template <typename Encoder>
agora::schema::bytes_t make_tally_prefix_key(
    Encoder& encoder,
    const agora::schema::proposal_id_t& proposal_id) {
  return make_prefixed_key(encoder, kTallyKeyPrefix, proposal_id);
}

template <typename Encoder>
agora::schema::bytes_t make_applied_message_key(
    Encoder& encoder,
    const agora::schema::proposal_id_t& proposal_id,
    const agora::schema::message_id_t& message_id) {
  return make_prefixed_key(encoder, kAppliedMessageKeyPrefix,
                           std::tuple{proposal_id, message_id});
}

template <typename Encoder>
agora::schema::bytes_t make_applied_message_prefix_key(
    Encoder& encoder,
    const agora::schema::proposal_id_t& proposal_id) {
  return make_prefixed_key(encoder, kAppliedMessageKeyPrefix, proposal_id);
}

template <typename Encoder>
agora::schema::bytes_t make_whitelist_key(
    Encoder& encoder,
    const agora::schema::address_t& address) {
  return make_prefixed_key(encoder, kWhitelistKeyPrefix, address);
}

template <typename Encoder>
agora::schema::bytes_t make_balance_key(
    Encoder& encoder,
    const agora::schema::token_id_t& token,
    const agora::schema::address_t& address) {
  return make_prefixed_key(encoder, kBalanceKeyPrefix,
                           std::tuple{token, address});
}

template <typename Encoder>
agora::schema::bytes_t make_route_key(Encoder& encoder,
                                      const agora::schema::chain_id_t& chain) {
  return make_prefixed_key(encoder, kRouteKeyPrefix, chain);
}

template <typename Encoder>
agora::schema::bytes_t make_outbox_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kOutboxSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
agora::schema::bytes_t make_event_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
agora::schema::bytes_t make_outbox_key(Encoder& encoder, uint64_t sequence) {
  return make_prefixed_key(encoder, kOutboxPrefix, sequence);
}

template <typename Encoder>
agora::schema::bytes_t make_history_key(Encoder& encoder,
                                        uint64_t height,
                                        uint32_t index) {
  return make_prefixed_key(encoder, kHistoryPrefix, std::tuple{height, index});
}

template <typename Encoder>
agora::schema::bytes_t make_event_key(Encoder& encoder, uint64_t event_id) {
  return make_prefixed_key(encoder, kEventPrefix, event_id);
}

template <typename Encoder>
std::optional<std::pair<uint64_t, uint32_t>> parse_history_key(
    Encoder& encoder,
    const agora::schema::bytes_view_t& key) {
  auto decoded = encoder.template try_decode<
      std::tuple<std::string, std::tuple<uint64_t, uint32_t>>>(key);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  if (std::get<0>(decoded.value()) != kHistoryPrefix) {
    return std::nullopt;
  }
  return std::pair<uint64_t, uint32_t>{
      std::get<0>(std::get<1>(decoded.value())),
      std::get<1>(std::get<1>(decoded.value()))};
}

}  // namespace agora::schema::key
