#pragma once

#include <agora/schema/primitives.hpp>

namespace agora::schema {

template <uint16_t Version>
struct set_minimum_tokens;

template <>
struct set_minimum_tokens<1> final {
  uint16_t version{1};
  dao_id_t dao_id{};
  amount_t minimum_tokens{};
};

using set_minimum_tokens_t = set_minimum_tokens<1>;

}  // namespace agora::schema
