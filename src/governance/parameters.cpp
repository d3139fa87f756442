#include <agora/common/critical.hpp>
#include <agora/governance/parameters.hpp>
#include <agora/schema/key/engine_keys.hpp>

namespace agora::governance {

agora::schema::governance_parameters_t load_parameters(
    const agora::execution::state_view& state) {
  auto parameters = state.get<agora::schema::governance_parameters_t>(
      agora::schema::key::make_parameters_key(state.encoder()));
  if (!parameters) {
    agora::common::critical("governance parameters are not initialized");
  }
  return *parameters;
}

void save_parameters(agora::execution::state_view& state,
                     const agora::schema::governance_parameters_t& parameters) {
  state.put(agora::schema::key::make_parameters_key(state.encoder()),
            parameters);
}

bool is_administrator(const agora::execution::state_view& state,
                      const agora::schema::address_t& caller) {
  return load_parameters(state).administrator == caller;
}

}  // namespace agora::governance
