#pragma once

#include <agora/schema/cast_vote.hpp>
#include <agora/schema/create_proposal.hpp>
#include <agora/schema/deliver_cross_chain.hpp>
#include <agora/schema/finalize_proposal.hpp>
#include <agora/schema/primitives.hpp>
#include <agora/schema/register_dao.hpp>
#include <agora/schema/send_cross_chain.hpp>
#include <agora/schema/set_creation_fee.hpp>
#include <agora/schema/set_dispatch_fee.hpp>
#include <agora/schema/set_minimum_tokens.hpp>
#include <agora/schema/upsert_route.hpp>
#include <agora/schema/upsert_token_balance.hpp>
#include <agora/schema/upsert_whitelist.hpp>
#include <agora/schema/withdraw_fees.hpp>
#include <variant>

namespace agora::schema {

using transaction_payload_t = std::variant<register_dao_t,
                                           set_minimum_tokens_t,
                                           set_creation_fee_t,
                                           create_proposal_t,
                                           cast_vote_t,
                                           finalize_proposal_t,
                                           send_cross_chain_t,
                                           deliver_cross_chain_t,
                                           upsert_whitelist_t,
                                           upsert_token_balance_t,
                                           upsert_route_t,
                                           set_dispatch_fee_t,
                                           withdraw_fees_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  chain_id_t chain_id{};
  uint64_t nonce{};
  signer_id_t signer{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

}  // namespace agora::schema
