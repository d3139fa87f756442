#pragma once

#include <agora/execution/state_view.hpp>
#include <agora/governance/call_context.hpp>
#include <agora/governance/fee_ledger.hpp>
#include <agora/schema/dao_record.hpp>
#include <agora/schema/register_dao.hpp>
#include <agora/schema/set_creation_fee.hpp>
#include <agora/schema/set_minimum_tokens.hpp>
#include <optional>

namespace agora::governance {

/// Append-only registry of DAO records.
class dao_registry final {
 public:
  dao_registry(agora::execution::state_view& state, fee_ledger& fees);

  /// Store a new DAO with the caller as controller.
  ///
  /// Rejects an already registered id with duplicate_id, and an attached fee
  /// below the configured creation fee with insufficient_fee.
  status_t register_dao(const call_context& context,
                        const agora::schema::register_dao_t& request);

  /// Only the DAO's controller may change its minimum token threshold.
  status_t set_minimum_tokens(
      const call_context& context,
      const agora::schema::set_minimum_tokens_t& request);

  /// Administrator only; applies to subsequent registrations.
  status_t set_creation_fee(const call_context& context,
                            const agora::schema::set_creation_fee_t& request);

  std::optional<agora::schema::dao_record_t> find(
      const agora::schema::dao_id_t& dao_id) const;

 private:
  agora::execution::state_view& state_;
  fee_ledger& fees_;
};

}  // namespace agora::governance
