#pragma once

#include <agora/schema/primitives.hpp>

namespace agora::schema {

template <uint16_t Version>
struct withdraw_fees;

template <>
struct withdraw_fees<1> final {
  uint16_t version{1};
};

using withdraw_fees_t = withdraw_fees<1>;

}  // namespace agora::schema
