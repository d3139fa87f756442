#pragma once

#include <agora/schema/primitives.hpp>

namespace agora::schema {

template <uint16_t Version>
struct finalize_proposal;

template <>
struct finalize_proposal<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
};

using finalize_proposal_t = finalize_proposal<1>;

}  // namespace agora::schema
