#pragma once

#include <agora/execution/state_view.hpp>
#include <agora/schema/primitives.hpp>

namespace agora::governance {

/// Eligibility source consulted by the vote aggregator.
class membership_oracle {
 public:
  virtual ~membership_oracle() = default;

  virtual bool is_whitelisted(
      const agora::schema::address_t& address) const = 0;
  virtual agora::schema::amount_t balance_of(
      const agora::schema::token_id_t& token,
      const agora::schema::address_t& address) const = 0;
};

/// Oracle backed by the whitelist and balance keyspaces that the
/// administrator maintains on chain.
class state_membership_oracle final : public membership_oracle {
 public:
  explicit state_membership_oracle(const agora::execution::state_view& state);

  bool is_whitelisted(const agora::schema::address_t& address) const override;
  agora::schema::amount_t balance_of(
      const agora::schema::token_id_t& token,
      const agora::schema::address_t& address) const override;

 private:
  const agora::execution::state_view& state_;
};

}  // namespace agora::governance
