#include <agora/governance/events.hpp>
#include <agora/governance/finalization_controller.hpp>

using namespace agora::schema;

namespace agora::governance {

finalization_controller::finalization_controller(proposal_store& proposals,
                                                 const dao_registry& registry)
    : proposals_{proposals}, registry_{registry} {}

status_t finalization_controller::finalize(const call_context& context,
                                           const proposal_id_t& proposal_id,
                                           const bool trusted) {
  auto proposal = proposals_.get(proposal_id);
  if (!proposal) {
    return transaction_error_code::proposal_not_found;
  }
  if (proposal->finalized) {
    return transaction_error_code::already_finalized;
  }
  if (!trusted) {
    auto dao = registry_.find(proposal->dao_id);
    if (!dao || dao->controller != context.caller) {
      return transaction_error_code::unauthorized;
    }
  }
  if (context.now <= proposal->end) {
    return transaction_error_code::voting_still_active;
  }

  auto outcome = proposal->total_weight >= proposal->quorum
                     ? proposal_outcome_t::passed
                     : proposal_outcome_t::quorum_not_met;
  proposal->finalized = true;
  proposal->outcome = outcome;
  proposal->finalized_at = context.now;
  proposals_.put(*proposal);
  proposals_.forget_applied_votes(proposal_id);

  context.events.push_back(
      make_event("proposal_finalized",
                 {{"proposal_id", attribute(proposal_id)},
                  {"dao_id", attribute(proposal->dao_id)},
                  {"total_weight", attribute(proposal->total_weight)},
                  {"quorum", attribute(proposal->quorum)},
                  {"outcome", std::string{to_string(outcome)}},
                  {"trusted", attribute(trusted)}}));
  return std::nullopt;
}

}  // namespace agora::governance
