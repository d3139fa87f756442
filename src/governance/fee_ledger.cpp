#include <agora/governance/events.hpp>
#include <agora/governance/fee_ledger.hpp>
#include <agora/governance/parameters.hpp>
#include <agora/schema/key/engine_keys.hpp>

using namespace agora::schema;

namespace agora::governance {

fee_ledger::fee_ledger(agora::execution::state_view& state) : state_{state} {}

fee_ledger_state_t fee_ledger::current() const {
  return state_
      .get<fee_ledger_state_t>(key::make_fee_ledger_key(state_.encoder()))
      .value_or(fee_ledger_state_t{});
}

status_t fee_ledger::collect(const amount_t& required,
                             const amount_t& attached) {
  if (attached < required) {
    return transaction_error_code::insufficient_fee;
  }
  if (attached == 0) {
    return std::nullopt;
  }
  auto ledger = current();
  ledger.balance += attached;
  ledger.total_collected += attached;
  state_.put(key::make_fee_ledger_key(state_.encoder()), ledger);
  return std::nullopt;
}

status_t fee_ledger::withdraw(const call_context& context) {
  if (!is_administrator(state_, context.caller)) {
    return transaction_error_code::unauthorized;
  }
  auto ledger = current();
  auto amount = ledger.balance;
  ledger.total_withdrawn += amount;
  ledger.balance = 0;
  state_.put(key::make_fee_ledger_key(state_.encoder()), ledger);
  context.events.push_back(
      make_event("fees_withdrawn", {{"recipient", attribute(context.caller)},
                                    {"amount", attribute(amount)}}));
  return std::nullopt;
}

}  // namespace agora::governance
