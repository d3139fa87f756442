#pragma once

#include <agora/schema/cross_chain_message.hpp>
#include <agora/schema/primitives.hpp>

// Schema type: envelope.
// Unit handed to the transport and appended to the outbox.
namespace agora::schema {

template <uint16_t Version>
struct envelope;

template <>
struct envelope<1> final {
  uint16_t version{1};
  chain_id_t source_chain{};
  chain_id_t destination_chain{};
  address_t sender{};
  address_t receiver{};
  uint64_t sequence{};
  cross_chain_message_t message{};
};

using envelope_t = envelope<1>;

}  // namespace agora::schema
