#pragma once

#include <agora/schema/primitives.hpp>
#include <agora/schema/proposal_outcome.hpp>
#include <optional>

// Schema type: proposal state.
// Per-voter weights live in vote_tally records keyed by (proposal, voter);
// total_weight is their sum.
namespace agora::schema {

template <uint16_t Version>
struct proposal_state;

template <>
struct proposal_state<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
  dao_id_t dao_id{};
  bytes_t description;
  timestamp_t start{};
  timestamp_t end{};
  weight_t quorum{};
  weight_t total_weight{};
  uint32_t voter_count{};
  bool finalized{};
  std::optional<proposal_outcome_t> outcome;
  // Set when the proposal was created by an inbound cross-chain message.
  std::optional<chain_id_t> origin_chain;
  timestamp_t created_at{};
  std::optional<timestamp_t> finalized_at;
};

using proposal_state_t = proposal_state<1>;

}  // namespace agora::schema
