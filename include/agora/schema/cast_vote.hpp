#pragma once

#include <agora/schema/primitives.hpp>

// Schema type: cast vote.
// The voter is the transaction signer.
namespace agora::schema {

template <uint16_t Version>
struct cast_vote;

template <>
struct cast_vote<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
  weight_t weight{};
};

using cast_vote_t = cast_vote<1>;

}  // namespace agora::schema
