#include <agora/governance/administration.hpp>
#include <agora/governance/events.hpp>
#include <agora/governance/parameters.hpp>
#include <agora/schema/key/engine_keys.hpp>

using namespace agora::schema;

namespace agora::governance {

administration::administration(agora::execution::state_view& state)
    : state_{state} {}

status_t administration::upsert_whitelist(const call_context& context,
                                          const upsert_whitelist_t& request) {
  if (!is_administrator(state_, context.caller)) {
    return transaction_error_code::unauthorized;
  }
  state_.put(key::make_whitelist_key(state_.encoder(), request.address),
             request.whitelisted);
  context.events.push_back(
      make_event("whitelist_updated",
                 {{"address", attribute(request.address)},
                  {"whitelisted", attribute(request.whitelisted)}}));
  return std::nullopt;
}

status_t administration::upsert_token_balance(
    const call_context& context,
    const upsert_token_balance_t& request) {
  if (!is_administrator(state_, context.caller)) {
    return transaction_error_code::unauthorized;
  }
  state_.put(
      key::make_balance_key(state_.encoder(), request.token, request.address),
      request.balance);
  context.events.push_back(
      make_event("balance_updated", {{"token", attribute(request.token)},
                                     {"address", attribute(request.address)},
                                     {"balance", attribute(request.balance)}}));
  return std::nullopt;
}

status_t administration::upsert_route(const call_context& context,
                                      const upsert_route_t& request) {
  if (!is_administrator(state_, context.caller)) {
    return transaction_error_code::unauthorized;
  }
  state_.put(key::make_route_key(state_.encoder(), request.chain), request);
  context.events.push_back(
      make_event("route_updated", {{"chain", attribute(request.chain)},
                                   {"receiver", attribute(request.receiver)},
                                   {"relayer", attribute(request.relayer)},
                                   {"enabled", attribute(request.enabled)}}));
  return std::nullopt;
}

status_t administration::set_dispatch_fee(const call_context& context,
                                          const set_dispatch_fee_t& request) {
  auto parameters = load_parameters(state_);
  if (parameters.administrator != context.caller) {
    return transaction_error_code::unauthorized;
  }
  parameters.dispatch_fee = request.fee;
  save_parameters(state_, parameters);
  context.events.push_back(
      make_event("dispatch_fee_updated", {{"fee", attribute(request.fee)}}));
  return std::nullopt;
}

std::optional<route_state_t> administration::route(
    const chain_id_t& chain) const {
  return state_.get<route_state_t>(key::make_route_key(state_.encoder(), chain));
}

}  // namespace agora::governance
