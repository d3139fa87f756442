#pragma once

#include <agora/crosschain/envelope_codec.hpp>
#include <agora/execution/state_view.hpp>
#include <agora/schema/envelope.hpp>
#include <agora/schema/outbox_entry.hpp>
#include <optional>
#include <vector>

namespace agora::crosschain {

struct transport_receipt final {
  uint64_t sequence{};
  agora::schema::message_id_t message_id{};
};

/// Outbound half of the messaging substrate.  Delivery is at-least-once and
/// unordered; the transport never retries on behalf of the caller.
class message_transport {
 public:
  virtual ~message_transport() = default;

  /// Hand `envelope` to the transport, addressed by its destination chain
  /// and receiver.  The transport stamps the sequence number.  std::nullopt
  /// means the hand-off failed.
  virtual std::optional<transport_receipt> send(
      agora::schema::envelope_t envelope) = 0;
};

/// Transport that appends envelopes to the local outbox keyspace, where a
/// relayer picks them up through /outbox/range.
class outbox_transport final : public message_transport {
 public:
  outbox_transport(agora::execution::state_view& state, envelope_codec codec);

  std::optional<transport_receipt> send(
      agora::schema::envelope_t envelope) override;

  /// Entries with sequence in [from, to]; sequences start at 1 and are dense.
  static std::vector<agora::schema::outbox_entry_t> range(
      const agora::execution::state_view& state,
      uint64_t from,
      uint64_t to);

 private:
  agora::execution::state_view& state_;
  envelope_codec codec_;
};

}  // namespace agora::crosschain
