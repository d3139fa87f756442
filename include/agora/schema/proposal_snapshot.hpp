#pragma once

#include <agora/schema/proposal_state.hpp>
#include <agora/schema/proposal_status.hpp>

// Schema type: proposal snapshot.
// Read only view returned by /state/proposal.
namespace agora::schema {

template <uint16_t Version>
struct proposal_snapshot;

template <>
struct proposal_snapshot<1> final {
  uint16_t version{1};
  proposal_state_t proposal;
  proposal_status_t status{};
};

using proposal_snapshot_t = proposal_snapshot<1>;

}  // namespace agora::schema
