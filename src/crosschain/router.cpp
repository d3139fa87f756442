#include <agora/crosschain/router.hpp>
#include <agora/governance/events.hpp>
#include <agora/governance/parameters.hpp>
#include <spdlog/spdlog.h>

using namespace agora::schema;
using agora::governance::attribute;
using agora::governance::call_context;
using agora::governance::make_event;
using agora::governance::status_t;

namespace agora::crosschain {

namespace {

const proposal_id_t& proposal_of(const cross_chain_message_t& message) {
  return std::visit(
      [](const auto& value) -> const proposal_id_t& {
        return value.proposal_id;
      },
      message);
}

std::string_view dispatched_event_type(const message_kind_t kind) {
  switch (kind) {
    case message_kind_t::create_proposal:
      return "cross_chain_proposal_dispatched";
    case message_kind_t::vote:
      return "cross_chain_vote_dispatched";
    case message_kind_t::finalize:
      return "cross_chain_finalize_dispatched";
  }
  return "cross_chain_message_dispatched";
}

}  // namespace

router::router(agora::execution::state_view& state,
               const envelope_codec& codec,
               message_transport& transport,
               agora::governance::proposal_store& proposals,
               const agora::governance::dao_registry& registry,
               agora::governance::vote_aggregator& votes,
               agora::governance::finalization_controller& finalization,
               agora::governance::fee_ledger& fees,
               const agora::governance::administration& administration)
    : state_{state},
      codec_{codec},
      transport_{transport},
      proposals_{proposals},
      registry_{registry},
      votes_{votes},
      finalization_{finalization},
      fees_{fees},
      administration_{administration} {}

status_t router::authorize_outbound(
    const call_context& context,
    const cross_chain_message_t& message) const {
  return std::visit(
      overloaded{
          [&](const create_proposal_message_t& value) -> status_t {
            auto dao = registry_.find(value.dao_id);
            if (!dao) {
              return transaction_error_code::unknown_dao;
            }
            if (dao->controller != context.caller) {
              return transaction_error_code::unauthorized;
            }
            return std::nullopt;
          },
          [&](const vote_message_t& value) -> status_t {
            if (value.voter != context.caller) {
              return transaction_error_code::unauthorized;
            }
            return std::nullopt;
          },
          [&](const finalize_message_t& value) -> status_t {
            auto proposal = proposals_.get(value.proposal_id);
            if (!proposal) {
              return transaction_error_code::proposal_not_found;
            }
            auto dao = registry_.find(proposal->dao_id);
            if (!dao || dao->controller != context.caller) {
              return transaction_error_code::unauthorized;
            }
            return std::nullopt;
          }},
      message);
}

status_t router::send(const call_context& context,
                      const send_cross_chain_t& request) {
  if (auto status = authorize_outbound(context, request.message)) {
    return status;
  }
  auto route = administration_.route(request.destination_chain);
  if (!route || !route->enabled) {
    return transaction_error_code::dispatch_failed;
  }
  auto parameters = agora::governance::load_parameters(state_);
  if (auto status = fees_.collect(parameters.dispatch_fee, request.fee)) {
    return status;
  }

  auto receipt = transport_.send(
      envelope_t{.source_chain = parameters.chain_id,
                 .destination_chain = request.destination_chain,
                 .sender = context.caller,
                 .receiver = route->receiver,
                 .message = request.message});
  if (!receipt) {
    return transaction_error_code::dispatch_failed;
  }

  context.events.push_back(make_event(
      dispatched_event_type(kind_of(request.message)),
      {{"destination_chain", attribute(request.destination_chain)},
       {"proposal_id", attribute(proposal_of(request.message))},
       {"sender", attribute(context.caller)},
       {"sequence", attribute(receipt->sequence)},
       {"message_id", attribute(receipt->message_id)}}));
  return std::nullopt;
}

status_t router::receive(const call_context& context,
                         const deliver_cross_chain_t& request) {
  auto parameters = agora::governance::load_parameters(state_);
  auto error = std::string{};
  auto envelope =
      codec_.decode(bytes_view_t{request.payload}, parameters.chain_id,
                    parameters.receiver, error);
  if (!envelope) {
    spdlog::debug("Rejected cross-chain payload: {}", error);
    return transaction_error_code::malformed_payload;
  }
  auto route = administration_.route(envelope->source_chain);
  if (!route || !route->enabled || route->relayer != context.caller) {
    return transaction_error_code::untrusted_relayer;
  }

  auto message_id = envelope_codec::message_id(bytes_view_t{request.payload});
  context.events.push_back(make_event(
      "cross_chain_message_received",
      {{"source_chain", attribute(envelope->source_chain)},
       {"sender", attribute(envelope->sender)},
       {"sequence", attribute(envelope->sequence)},
       {"kind", std::string{to_string(kind_of(envelope->message))}},
       {"message_id", attribute(message_id)}}));
  return dispatch(context, *envelope, message_id);
}

status_t router::dispatch(const call_context& context,
                          const envelope_t& envelope,
                          const message_id_t& message_id) {
  auto applied = applied_message_t{.proposal_id = proposal_of(envelope.message),
                                   .message_id = message_id,
                                   .kind = kind_of(envelope.message),
                                   .source_chain = envelope.source_chain,
                                   .sequence = envelope.sequence,
                                   .applied_at = context.now};
  return std::visit(
      overloaded{
          [&](const create_proposal_message_t& value) -> status_t {
            if (proposals_.has_applied(value.proposal_id, message_id)) {
              return transaction_error_code::duplicate_message;
            }
            auto remote_context = call_context{.caller = envelope.sender,
                                               .now = context.now,
                                               .events = context.events};
            auto status = proposals_.create(
                remote_context,
                create_proposal_t{.dao_id = value.dao_id,
                                  .proposal_id = value.proposal_id,
                                  .description = value.description,
                                  .start = value.start,
                                  .end = value.end,
                                  .quorum = value.quorum},
                envelope.source_chain);
            if (!status) {
              proposals_.record_applied(applied);
            }
            return status;
          },
          [&](const vote_message_t& value) -> status_t {
            if (value.voter != envelope.sender) {
              return transaction_error_code::malformed_payload;
            }
            // The aggregator checks and records the message id itself.
            return votes_.apply_vote(
                context, value.proposal_id, value.voter, value.weight,
                remote_source_t{.chain = envelope.source_chain,
                                .sequence = envelope.sequence,
                                .message_id = message_id});
          },
          [&](const finalize_message_t& value) -> status_t {
            if (proposals_.has_applied(value.proposal_id, message_id)) {
              return transaction_error_code::duplicate_message;
            }
            // Only a proposal mirrored from the sending chain takes the
            // route's word for it; any other needs its controller as sender.
            auto proposal = proposals_.get(value.proposal_id);
            auto mirrored =
                proposal && proposal->origin_chain == envelope.source_chain;
            auto remote_context = call_context{.caller = envelope.sender,
                                               .now = context.now,
                                               .events = context.events};
            auto status = finalization_.finalize(
                remote_context, value.proposal_id, mirrored);
            if (!status) {
              proposals_.record_applied(applied);
            }
            return status;
          }},
      envelope.message);
}

}  // namespace agora::crosschain
