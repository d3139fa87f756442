#pragma once

#include <agora/schema/primitives.hpp>

// Schema type: create proposal.
namespace agora::schema {

template <uint16_t Version>
struct create_proposal;

template <>
struct create_proposal<1> final {
  uint16_t version{1};
  dao_id_t dao_id{};
  proposal_id_t proposal_id{};
  bytes_t description;
  timestamp_t start{};
  timestamp_t end{};
  weight_t quorum{};
};

using create_proposal_t = create_proposal<1>;

}  // namespace agora::schema
