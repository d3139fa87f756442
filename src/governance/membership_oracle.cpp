#include <agora/governance/membership_oracle.hpp>
#include <agora/schema/key/engine_keys.hpp>

namespace agora::governance {

state_membership_oracle::state_membership_oracle(
    const agora::execution::state_view& state)
    : state_{state} {}

bool state_membership_oracle::is_whitelisted(
    const agora::schema::address_t& address) const {
  return state_
      .get<bool>(agora::schema::key::make_whitelist_key(state_.encoder(),
                                                        address))
      .value_or(false);
}

agora::schema::amount_t state_membership_oracle::balance_of(
    const agora::schema::token_id_t& token,
    const agora::schema::address_t& address) const {
  return state_
      .get<agora::schema::amount_t>(agora::schema::key::make_balance_key(
          state_.encoder(), token, address))
      .value_or(agora::schema::amount_t{0});
}

}  // namespace agora::governance
