#pragma once

#include <agora/schema/message_kind.hpp>
#include <agora/schema/primitives.hpp>

// Schema type: applied message.
// Dedup marker for an inbound envelope that was routed successfully.
namespace agora::schema {

template <uint16_t Version>
struct applied_message;

template <>
struct applied_message<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
  message_id_t message_id{};
  message_kind_t kind{};
  chain_id_t source_chain{};
  uint64_t sequence{};
  timestamp_t applied_at{};
};

using applied_message_t = applied_message<1>;

}  // namespace agora::schema
