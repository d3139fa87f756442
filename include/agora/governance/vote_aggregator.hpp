#pragma once

#include <agora/governance/call_context.hpp>
#include <agora/governance/dao_registry.hpp>
#include <agora/governance/membership_oracle.hpp>
#include <agora/governance/proposal_store.hpp>
#include <agora/schema/vote_source.hpp>

namespace agora::governance {

/// Applies single votes to proposal tallies.
///
/// Weight is additive: repeated votes from one voter accumulate.  Remote
/// votes carry the message id of their envelope and are applied at most once
/// per proposal; the id is recorded only when the vote is accepted.
class vote_aggregator final {
 public:
  vote_aggregator(proposal_store& proposals,
                  const dao_registry& registry,
                  const membership_oracle& oracle);

  /// Checks run in order: duplicate_message (remote only), not_eligible,
  /// proposal_not_found, voting_not_active, insufficient_tokens,
  /// weight_overflow.
  status_t apply_vote(const call_context& context,
                      const agora::schema::proposal_id_t& proposal_id,
                      const agora::schema::address_t& voter,
                      agora::schema::weight_t weight,
                      const agora::schema::vote_source_t& source);

 private:
  proposal_store& proposals_;
  const dao_registry& registry_;
  const membership_oracle& oracle_;
};

}  // namespace agora::governance
