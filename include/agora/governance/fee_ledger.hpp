#pragma once

#include <agora/execution/state_view.hpp>
#include <agora/governance/call_context.hpp>
#include <agora/schema/fee_ledger_state.hpp>

namespace agora::governance {

/// Payment ledger for creation and dispatch fees.
class fee_ledger final {
 public:
  explicit fee_ledger(agora::execution::state_view& state);

  /// Retain `attached` when it covers `required`.  The full attached amount
  /// is kept; there is no change given back.
  status_t collect(const agora::schema::amount_t& required,
                   const agora::schema::amount_t& attached);

  /// Pay the whole balance out to the administrator.
  status_t withdraw(const call_context& context);

  agora::schema::fee_ledger_state_t current() const;

 private:
  agora::execution::state_view& state_;
};

}  // namespace agora::governance
