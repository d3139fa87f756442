#pragma once

#include <agora/execution/state_view.hpp>
#include <agora/governance/call_context.hpp>
#include <agora/governance/dao_registry.hpp>
#include <agora/schema/applied_message.hpp>
#include <agora/schema/create_proposal.hpp>
#include <agora/schema/proposal_snapshot.hpp>
#include <agora/schema/proposal_state.hpp>
#include <agora/schema/proposal_status.hpp>
#include <agora/schema/vote_tally.hpp>
#include <optional>
#include <vector>

namespace agora::governance {

/// Proposal records, their per-voter tallies and the applied message ids of
/// inbound cross-chain deliveries.
class proposal_store final {
 public:
  proposal_store(agora::execution::state_view& state,
                 const dao_registry& registry);

  /// Create a proposal owned by `request.dao_id`.
  ///
  /// An existing id is rejected with duplicate_proposal before any other
  /// argument is looked at.  `origin_chain` is set for proposals created by
  /// an inbound message, in which case the caller is the remote sender.
  status_t create(const call_context& context,
                  const agora::schema::create_proposal_t& request,
                  const std::optional<agora::schema::chain_id_t>& origin_chain =
                      std::nullopt);

  std::optional<agora::schema::proposal_state_t> get(
      const agora::schema::proposal_id_t& proposal_id) const;

  std::optional<agora::schema::proposal_snapshot_t> snapshot(
      const agora::schema::proposal_id_t& proposal_id,
      agora::schema::timestamp_t now) const;

  /// Accumulated weight of voter, zero when the voter never voted.
  agora::schema::weight_t tally(
      const agora::schema::proposal_id_t& proposal_id,
      const agora::schema::address_t& voter) const;

  std::vector<agora::schema::vote_tally_t> tallies(
      const agora::schema::proposal_id_t& proposal_id) const;

  void put(const agora::schema::proposal_state_t& proposal);
  void put_tally(const agora::schema::vote_tally_t& tally);

  bool has_applied(const agora::schema::proposal_id_t& proposal_id,
                   const agora::schema::message_id_t& message_id) const;
  void record_applied(const agora::schema::applied_message_t& applied);

  /// Drop the vote message ids recorded for a proposal.  Called once the
  /// proposal is finalized, when a redelivered vote is refused anyway.
  void forget_applied_votes(const agora::schema::proposal_id_t& proposal_id);

  static agora::schema::proposal_status_t status_of(
      const agora::schema::proposal_state_t& proposal,
      agora::schema::timestamp_t now);

 private:
  agora::execution::state_view& state_;
  const dao_registry& registry_;
};

}  // namespace agora::governance
