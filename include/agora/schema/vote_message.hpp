#pragma once

#include <agora/schema/primitives.hpp>

namespace agora::schema {

template <uint16_t Version>
struct vote_message;

template <>
struct vote_message<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
  weight_t weight{};
  address_t voter{};
};

using vote_message_t = vote_message<1>;

}  // namespace agora::schema
