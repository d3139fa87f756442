#include <agora/governance/events.hpp>
#include <agora/governance/vote_aggregator.hpp>
#include <limits>

using namespace agora::schema;

namespace agora::governance {

vote_aggregator::vote_aggregator(proposal_store& proposals,
                                 const dao_registry& registry,
                                 const membership_oracle& oracle)
    : proposals_{proposals}, registry_{registry}, oracle_{oracle} {}

status_t vote_aggregator::apply_vote(const call_context& context,
                                     const proposal_id_t& proposal_id,
                                     const address_t& voter,
                                     const weight_t weight,
                                     const vote_source_t& source) {
  const auto* remote = std::get_if<remote_source_t>(&source);
  if (remote != nullptr &&
      proposals_.has_applied(proposal_id, remote->message_id)) {
    return transaction_error_code::duplicate_message;
  }
  if (!oracle_.is_whitelisted(voter)) {
    return transaction_error_code::not_eligible;
  }
  auto proposal = proposals_.get(proposal_id);
  if (!proposal) {
    return transaction_error_code::proposal_not_found;
  }
  if (proposal_store::status_of(*proposal, context.now) !=
      proposal_status_t::active) {
    return transaction_error_code::voting_not_active;
  }
  auto dao = registry_.find(proposal->dao_id);
  if (!dao) {
    return transaction_error_code::unknown_dao;
  }
  if (oracle_.balance_of(dao->governance_token, voter) < dao->minimum_tokens) {
    return transaction_error_code::insufficient_tokens;
  }
  if (weight > std::numeric_limits<weight_t>::max() - proposal->total_weight) {
    return transaction_error_code::weight_overflow;
  }

  auto previous = proposals_.tally(proposal_id, voter);
  if (previous == 0 && weight > 0) {
    ++proposal->voter_count;
  }
  // Per-voter weights never exceed the total, so the tally cannot overflow
  // once the total did not.
  proposals_.put_tally(vote_tally_t{.proposal_id = proposal_id,
                                    .voter = voter,
                                    .weight = previous + weight,
                                    .updated_at = context.now});
  proposal->total_weight += weight;
  proposals_.put(*proposal);

  if (remote != nullptr) {
    proposals_.record_applied(
        applied_message_t{.proposal_id = proposal_id,
                          .message_id = remote->message_id,
                          .kind = message_kind_t::vote,
                          .source_chain = remote->chain,
                          .sequence = remote->sequence,
                          .applied_at = context.now});
  }

  auto source_chain =
      remote != nullptr ? attribute(remote->chain) : std::string{"local"};
  context.events.push_back(
      make_event("vote_accepted",
                 {{"proposal_id", attribute(proposal_id)},
                  {"voter", attribute(voter)},
                  {"weight", attribute(weight)},
                  {"voter_weight", attribute(previous + weight)},
                  {"total_weight", attribute(proposal->total_weight)},
                  {"source", source_chain}}));
  return std::nullopt;
}

}  // namespace agora::governance
