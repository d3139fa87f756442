#pragma once

#include <agora/governance/call_context.hpp>
#include <agora/governance/dao_registry.hpp>
#include <agora/governance/proposal_store.hpp>

namespace agora::governance {

class finalization_controller final {
 public:
  finalization_controller(proposal_store& proposals,
                          const dao_registry& registry);

  /// Move a proposal whose window has closed to its terminal state and
  /// record the quorum outcome.
  ///
  /// `trusted` skips the controller check.  The router sets it only for a
  /// proposal mirrored from the chain that sent the finalize message; the
  /// sending chain checked its own controller before dispatch.
  status_t finalize(const call_context& context,
                    const agora::schema::proposal_id_t& proposal_id,
                    bool trusted = false);

 private:
  proposal_store& proposals_;
  const dao_registry& registry_;
};

}  // namespace agora::governance
