#pragma once

#include <agora/execution/state_view.hpp>
#include <agora/governance/call_context.hpp>
#include <agora/schema/route_state.hpp>
#include <agora/schema/set_dispatch_fee.hpp>
#include <agora/schema/upsert_route.hpp>
#include <agora/schema/upsert_token_balance.hpp>
#include <agora/schema/upsert_whitelist.hpp>
#include <optional>

namespace agora::governance {

/// Administrator-only maintenance of the membership keyspaces, routes and
/// the dispatch fee.  Every operation fails with unauthorized for any other
/// caller.
class administration final {
 public:
  explicit administration(agora::execution::state_view& state);

  status_t upsert_whitelist(const call_context& context,
                            const agora::schema::upsert_whitelist_t& request);
  status_t upsert_token_balance(
      const call_context& context,
      const agora::schema::upsert_token_balance_t& request);
  status_t upsert_route(const call_context& context,
                        const agora::schema::upsert_route_t& request);
  status_t set_dispatch_fee(const call_context& context,
                            const agora::schema::set_dispatch_fee_t& request);

  std::optional<agora::schema::route_state_t> route(
      const agora::schema::chain_id_t& chain) const;

 private:
  agora::execution::state_view& state_;
};

}  // namespace agora::governance
