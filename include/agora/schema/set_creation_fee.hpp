#pragma once

#include <agora/schema/primitives.hpp>

namespace agora::schema {

template <uint16_t Version>
struct set_creation_fee;

template <>
struct set_creation_fee<1> final {
  uint16_t version{1};
  amount_t fee{};
};

using set_creation_fee_t = set_creation_fee<1>;

}  // namespace agora::schema
