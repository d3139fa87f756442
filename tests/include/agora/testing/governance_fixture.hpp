#pragma once

#include <agora/governance/administration.hpp>
#include <agora/governance/call_context.hpp>
#include <agora/governance/dao_registry.hpp>
#include <agora/governance/fee_ledger.hpp>
#include <agora/governance/finalization_controller.hpp>
#include <agora/governance/membership_oracle.hpp>
#include <agora/governance/proposal_store.hpp>
#include <agora/governance/vote_aggregator.hpp>
#include <agora/testing/execution_harness.hpp>

#include <map>
#include <string_view>
#include <utility>
#include <vector>

namespace agora::testing {

/// In-memory oracle for driving eligibility directly from tests.
class fixed_membership_oracle final
    : public agora::governance::membership_oracle {
 public:
  void whitelist(const agora::schema::address_t& address) {
    whitelisted_[address] = true;
  }
  void set_balance(const agora::schema::token_id_t& token,
                   const agora::schema::address_t& address,
                   agora::schema::amount_t balance) {
    balances_[{token, address}] = std::move(balance);
  }

  bool is_whitelisted(const agora::schema::address_t& address) const override {
    auto found = whitelisted_.find(address);
    return found != std::end(whitelisted_) && found->second;
  }

  agora::schema::amount_t balance_of(
      const agora::schema::token_id_t& token,
      const agora::schema::address_t& address) const override {
    auto found = balances_.find({token, address});
    return found == std::end(balances_) ? agora::schema::amount_t{0}
                                        : found->second;
  }

 private:
  std::map<agora::schema::address_t, bool> whitelisted_;
  std::map<std::pair<agora::schema::token_id_t, agora::schema::address_t>,
           agora::schema::amount_t>
      balances_;
};

/// Governance components wired over one state_fixture.
struct governance_fixture final {
  explicit governance_fixture(const std::string_view prefix,
                              agora::schema::amount_t creation_fee = 0)
      : base{prefix, std::move(creation_fee)},
        fees{base.state},
        registry{base.state, fees},
        proposals{base.state, registry},
        votes{proposals, registry, oracle},
        finalization{proposals, registry},
        administration{base.state} {}

  agora::governance::call_context context(
      const agora::schema::address_t& caller,
      const agora::schema::timestamp_t now) {
    return agora::governance::call_context{
        .caller = caller, .now = now, .events = events};
  }

  /// Registers `dao_id` controlled by `controller` with governance token
  /// `token` and the given minimum balance.
  void register_dao(const agora::schema::dao_id_t& dao_id,
                    const agora::schema::address_t& controller,
                    const agora::schema::token_id_t& token,
                    agora::schema::amount_t minimum_tokens = 0) {
    auto status = registry.register_dao(
        context(controller, 1),
        agora::schema::register_dao_t{
            .dao_id = dao_id,
            .name = agora::schema::make_bytes(std::string_view{"dao"}),
            .governance_token = token,
            .minimum_tokens = std::move(minimum_tokens)});
    EXPECT_FALSE(status.has_value());
  }

  void create_proposal(const agora::schema::dao_id_t& dao_id,
                       const agora::schema::proposal_id_t& proposal_id,
                       const agora::schema::address_t& controller,
                       const agora::schema::timestamp_t start,
                       const agora::schema::timestamp_t end,
                       const agora::schema::weight_t quorum) {
    auto status = proposals.create(
        context(controller, 1),
        agora::schema::create_proposal_t{.dao_id = dao_id,
                                         .proposal_id = proposal_id,
                                         .start = start,
                                         .end = end,
                                         .quorum = quorum});
    EXPECT_FALSE(status.has_value());
  }

  state_fixture base;
  fixed_membership_oracle oracle;
  agora::governance::fee_ledger fees;
  agora::governance::dao_registry registry;
  agora::governance::proposal_store proposals;
  agora::governance::vote_aggregator votes;
  agora::governance::finalization_controller finalization;
  agora::governance::administration administration;
  std::vector<agora::schema::transaction_event_t> events;
};

}  // namespace agora::testing
