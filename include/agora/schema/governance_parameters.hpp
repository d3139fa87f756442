#pragma once

#include <agora/schema/primitives.hpp>

// Schema type: governance parameters.
// Written once at genesis; fees are adjusted later by the administrator.
namespace agora::schema {

template <uint16_t Version>
struct governance_parameters;

template <>
struct governance_parameters<1> final {
  uint16_t version{1};
  address_t administrator{};
  chain_id_t chain_id{};
  // Address remote chains must name as envelope receiver.
  address_t receiver{};
  amount_t creation_fee{};
  amount_t dispatch_fee{};
};

using governance_parameters_t = governance_parameters<1>;

}  // namespace agora::schema
