#pragma once

#include <agora/crosschain/envelope_codec.hpp>
#include <agora/crosschain/message_transport.hpp>
#include <agora/execution/state_view.hpp>
#include <agora/governance/administration.hpp>
#include <agora/governance/call_context.hpp>
#include <agora/governance/dao_registry.hpp>
#include <agora/governance/fee_ledger.hpp>
#include <agora/governance/finalization_controller.hpp>
#include <agora/governance/proposal_store.hpp>
#include <agora/governance/vote_aggregator.hpp>
#include <agora/schema/deliver_cross_chain.hpp>
#include <agora/schema/send_cross_chain.hpp>

namespace agora::crosschain {

/// Outbound dispatch and inbound routing of cross-chain intents.
///
/// The sending chain gates what the receiving chain trusts: it only
/// dispatches proposal creation and finalization for its own controllers and
/// votes cast by the caller.  Inbound payloads are accepted only from the
/// relayer named by an enabled route for the source chain.
class router final {
 public:
  router(agora::execution::state_view& state,
         const envelope_codec& codec,
         message_transport& transport,
         agora::governance::proposal_store& proposals,
         const agora::governance::dao_registry& registry,
         agora::governance::vote_aggregator& votes,
         agora::governance::finalization_controller& finalization,
         agora::governance::fee_ledger& fees,
         const agora::governance::administration& administration);

  agora::governance::status_t send(
      const agora::governance::call_context& context,
      const agora::schema::send_cross_chain_t& request);

  agora::governance::status_t receive(
      const agora::governance::call_context& context,
      const agora::schema::deliver_cross_chain_t& request);

 private:
  agora::governance::status_t authorize_outbound(
      const agora::governance::call_context& context,
      const agora::schema::cross_chain_message_t& message) const;

  agora::governance::status_t dispatch(
      const agora::governance::call_context& context,
      const agora::schema::envelope_t& envelope,
      const agora::schema::message_id_t& message_id);

  agora::execution::state_view& state_;
  const envelope_codec& codec_;
  message_transport& transport_;
  agora::governance::proposal_store& proposals_;
  const agora::governance::dao_registry& registry_;
  agora::governance::vote_aggregator& votes_;
  agora::governance::finalization_controller& finalization_;
  agora::governance::fee_ledger& fees_;
  const agora::governance::administration& administration_;
};

}  // namespace agora::crosschain
