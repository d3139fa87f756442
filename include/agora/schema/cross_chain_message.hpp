#pragma once

#include <agora/schema/create_proposal_message.hpp>
#include <agora/schema/finalize_message.hpp>
#include <agora/schema/message_kind.hpp>
#include <agora/schema/vote_message.hpp>
#include <variant>

namespace agora::schema {

// Alternative order is the wire tag; see message_kind_t.
using cross_chain_message_t = std::variant<create_proposal_message_t,
                                           vote_message_t,
                                           finalize_message_t>;

inline message_kind_t kind_of(const cross_chain_message_t& message) {
  return static_cast<message_kind_t>(message.index());
}

}  // namespace agora::schema
