#include <agora/governance/events.hpp>
#include <agora/governance/proposal_store.hpp>
#include <agora/schema/key/engine_keys.hpp>

using namespace agora::schema;

namespace agora::governance {

proposal_store::proposal_store(agora::execution::state_view& state,
                               const dao_registry& registry)
    : state_{state}, registry_{registry} {}

status_t proposal_store::create(const call_context& context,
                                const create_proposal_t& request,
                                const std::optional<chain_id_t>& origin_chain) {
  auto key = key::make_proposal_key(state_.encoder(), request.proposal_id);
  if (state_.contains(key)) {
    return transaction_error_code::duplicate_proposal;
  }
  auto dao = registry_.find(request.dao_id);
  if (!dao) {
    return transaction_error_code::unknown_dao;
  }
  if (dao->controller != context.caller) {
    return transaction_error_code::unauthorized;
  }
  if (request.end <= request.start) {
    return transaction_error_code::invalid_time_window;
  }

  state_.put(key, proposal_state_t{.proposal_id = request.proposal_id,
                                   .dao_id = request.dao_id,
                                   .description = request.description,
                                   .start = request.start,
                                   .end = request.end,
                                   .quorum = request.quorum,
                                   .origin_chain = origin_chain,
                                   .created_at = context.now});
  context.events.push_back(
      make_event("proposal_created",
                 {{"proposal_id", attribute(request.proposal_id)},
                  {"dao_id", attribute(request.dao_id)},
                  {"start", attribute(request.start)},
                  {"end", attribute(request.end)},
                  {"quorum", attribute(request.quorum)},
                  {"remote", attribute(origin_chain.has_value())}}));
  return std::nullopt;
}

std::optional<proposal_state_t> proposal_store::get(
    const proposal_id_t& proposal_id) const {
  return state_.get<proposal_state_t>(
      key::make_proposal_key(state_.encoder(), proposal_id));
}

std::optional<proposal_snapshot_t> proposal_store::snapshot(
    const proposal_id_t& proposal_id,
    const timestamp_t now) const {
  auto proposal = get(proposal_id);
  if (!proposal) {
    return std::nullopt;
  }
  auto status = status_of(*proposal, now);
  return proposal_snapshot_t{.proposal = std::move(*proposal),
                             .status = status};
}

weight_t proposal_store::tally(const proposal_id_t& proposal_id,
                               const address_t& voter) const {
  auto record = state_.get<vote_tally_t>(
      key::make_tally_key(state_.encoder(), proposal_id, voter));
  return record ? record->weight : weight_t{0};
}

std::vector<vote_tally_t> proposal_store::tallies(
    const proposal_id_t& proposal_id) const {
  auto entries = state_.list_by_prefix(
      key::make_tally_prefix_key(state_.encoder(), proposal_id));
  auto out = std::vector<vote_tally_t>{};
  out.reserve(entries.size());
  for (const auto& [key, value] : entries) {
    out.push_back(
        state_.encoder().decode<vote_tally_t>(bytes_view_t{value}));
  }
  return out;
}

void proposal_store::put(const proposal_state_t& proposal) {
  state_.put(key::make_proposal_key(state_.encoder(), proposal.proposal_id),
             proposal);
}

void proposal_store::put_tally(const vote_tally_t& tally) {
  state_.put(
      key::make_tally_key(state_.encoder(), tally.proposal_id, tally.voter),
      tally);
}

bool proposal_store::has_applied(const proposal_id_t& proposal_id,
                                 const message_id_t& message_id) const {
  return state_.contains(key::make_applied_message_key(
      state_.encoder(), proposal_id, message_id));
}

void proposal_store::record_applied(const applied_message_t& applied) {
  state_.put(key::make_applied_message_key(
                 state_.encoder(), applied.proposal_id, applied.message_id),
             applied);
}

void proposal_store::forget_applied_votes(const proposal_id_t& proposal_id) {
  auto entries = state_.list_by_prefix(
      key::make_applied_message_prefix_key(state_.encoder(), proposal_id));
  for (const auto& [key, value] : entries) {
    auto applied =
        state_.encoder().decode<applied_message_t>(bytes_view_t{value});
    if (applied.kind == message_kind_t::vote) {
      state_.erase(key);
    }
  }
}

proposal_status_t proposal_store::status_of(const proposal_state_t& proposal,
                                            const timestamp_t now) {
  if (proposal.finalized) {
    return proposal_status_t::finalized;
  }
  if (now < proposal.start) {
    return proposal_status_t::pending;
  }
  if (now <= proposal.end) {
    return proposal_status_t::active;
  }
  return proposal_status_t::ended;
}

}  // namespace agora::governance
