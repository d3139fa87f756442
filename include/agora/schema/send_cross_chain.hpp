#pragma once

#include <agora/schema/cross_chain_message.hpp>
#include <agora/schema/primitives.hpp>

namespace agora::schema {

template <uint16_t Version>
struct send_cross_chain;

template <>
struct send_cross_chain<1> final {
  uint16_t version{1};
  chain_id_t destination_chain{};
  cross_chain_message_t message{};
  amount_t fee{};
};

using send_cross_chain_t = send_cross_chain<1>;

}  // namespace agora::schema
