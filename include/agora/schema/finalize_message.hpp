#pragma once

#include <agora/schema/primitives.hpp>

namespace agora::schema {

template <uint16_t Version>
struct finalize_message;

template <>
struct finalize_message<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
};

using finalize_message_t = finalize_message<1>;

}  // namespace agora::schema
