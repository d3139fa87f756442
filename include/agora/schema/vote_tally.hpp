#pragma once

#include <agora/schema/primitives.hpp>

namespace agora::schema {

template <uint16_t Version>
struct vote_tally;

template <>
struct vote_tally<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
  address_t voter{};
  weight_t weight{};
  timestamp_t updated_at{};
};

using vote_tally_t = vote_tally<1>;

}  // namespace agora::schema
