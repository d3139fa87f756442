#include <agora/governance/dao_registry.hpp>
#include <agora/governance/events.hpp>
#include <agora/governance/parameters.hpp>
#include <agora/schema/key/engine_keys.hpp>
#include <spdlog/spdlog.h>

using namespace agora::schema;

namespace agora::governance {

dao_registry::dao_registry(agora::execution::state_view& state,
                           fee_ledger& fees)
    : state_{state}, fees_{fees} {}

std::optional<dao_record_t> dao_registry::find(const dao_id_t& dao_id) const {
  return state_.get<dao_record_t>(key::make_dao_key(state_.encoder(), dao_id));
}

status_t dao_registry::register_dao(const call_context& context,
                                    const register_dao_t& request) {
  auto key = key::make_dao_key(state_.encoder(), request.dao_id);
  if (state_.contains(key)) {
    return transaction_error_code::duplicate_id;
  }
  // A zero controller could never pass the controller check again.
  if (is_zero(context.caller)) {
    return transaction_error_code::unauthorized;
  }
  auto parameters = load_parameters(state_);
  if (auto status = fees_.collect(parameters.creation_fee, request.fee)) {
    return status;
  }

  state_.put(key, dao_record_t{.dao_id = request.dao_id,
                               .controller = context.caller,
                               .name = request.name,
                               .description = request.description,
                               .metadata_ref = request.metadata_ref,
                               .governance_token = request.governance_token,
                               .minimum_tokens = request.minimum_tokens,
                               .created_at = context.now});
  context.events.push_back(make_event(
      "dao_created",
      {{"dao_id", attribute(request.dao_id)},
       {"controller", attribute(context.caller)},
       {"governance_token", attribute(request.governance_token)},
       {"minimum_tokens", attribute(request.minimum_tokens)},
       {"fee", attribute(request.fee)}}));
  spdlog::debug("Registered DAO {}", attribute(request.dao_id));
  return std::nullopt;
}

status_t dao_registry::set_minimum_tokens(const call_context& context,
                                          const set_minimum_tokens_t& request) {
  auto record = find(request.dao_id);
  if (!record) {
    return transaction_error_code::unknown_dao;
  }
  if (record->controller != context.caller) {
    return transaction_error_code::unauthorized;
  }
  record->minimum_tokens = request.minimum_tokens;
  state_.put(key::make_dao_key(state_.encoder(), request.dao_id), *record);
  context.events.push_back(
      make_event("dao_updated",
                 {{"dao_id", attribute(request.dao_id)},
                  {"minimum_tokens", attribute(request.minimum_tokens)}}));
  return std::nullopt;
}

status_t dao_registry::set_creation_fee(const call_context& context,
                                        const set_creation_fee_t& request) {
  auto parameters = load_parameters(state_);
  if (parameters.administrator != context.caller) {
    return transaction_error_code::unauthorized;
  }
  parameters.creation_fee = request.fee;
  save_parameters(state_, parameters);
  context.events.push_back(
      make_event("creation_fee_updated", {{"fee", attribute(request.fee)}}));
  return std::nullopt;
}

}  // namespace agora::governance
