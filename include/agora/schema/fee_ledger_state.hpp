#pragma once

#include <agora/schema/primitives.hpp>

namespace agora::schema {

template <uint16_t Version>
struct fee_ledger_state;

template <>
struct fee_ledger_state<1> final {
  uint16_t version{1};
  amount_t balance{};
  amount_t total_collected{};
  amount_t total_withdrawn{};
};

using fee_ledger_state_t = fee_ledger_state<1>;

}  // namespace agora::schema
