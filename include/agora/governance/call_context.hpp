#pragma once

#include <agora/schema/primitives.hpp>
#include <agora/schema/transaction_error_code.hpp>
#include <agora/schema/transaction_event.hpp>
#include <optional>
#include <vector>

namespace agora::governance {

/// std::nullopt on success, otherwise the rejection reason.
using status_t = std::optional<agora::schema::transaction_error_code>;

/// Per-operation execution context.  `now` is the receiving chain's block
/// time; events are discarded by the engine when the operation is rejected.
struct call_context final {
  agora::schema::address_t caller{};
  agora::schema::timestamp_t now{};
  std::vector<agora::schema::transaction_event_t>& events;
};

}  // namespace agora::governance
