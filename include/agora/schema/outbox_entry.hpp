#pragma once

#include <agora/schema/envelope.hpp>
#include <agora/schema/primitives.hpp>

// Schema type: outbox entry.
// Payload is the exact byte string a relayer submits to the destination.
namespace agora::schema {

template <uint16_t Version>
struct outbox_entry;

template <>
struct outbox_entry<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  chain_id_t destination_chain{};
  message_id_t message_id{};
  message_kind_t kind{};
  bytes_t payload;
};

using outbox_entry_t = outbox_entry<1>;

}  // namespace agora::schema
