#pragma once

#include <agora/execution/state_view.hpp>
#include <agora/schema/governance_parameters.hpp>

namespace agora::governance {

/// Parameters are written at genesis, so a missing record is a broken
/// invariant rather than a business failure.
agora::schema::governance_parameters_t load_parameters(
    const agora::execution::state_view& state);

void save_parameters(agora::execution::state_view& state,
                     const agora::schema::governance_parameters_t& parameters);

bool is_administrator(const agora::execution::state_view& state,
                      const agora::schema::address_t& caller);

}  // namespace agora::governance
