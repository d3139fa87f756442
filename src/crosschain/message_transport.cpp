#include <agora/crosschain/message_transport.hpp>
#include <agora/schema/key/engine_keys.hpp>

#include <algorithm>

using namespace agora::schema;

namespace agora::crosschain {

outbox_transport::outbox_transport(agora::execution::state_view& state,
                                   envelope_codec codec)
    : state_{state}, codec_{codec} {}

std::optional<transport_receipt> outbox_transport::send(envelope_t envelope) {
  auto sequence_key = key::make_outbox_sequence_key(state_.encoder());
  auto sequence = state_.get<uint64_t>(sequence_key).value_or(1);

  envelope.sequence = sequence;
  auto encoded = codec_.encode(envelope);
  auto message_id = envelope_codec::message_id(bytes_view_t{encoded.payload});

  state_.put(key::make_outbox_key(state_.encoder(), sequence),
             outbox_entry_t{.sequence = sequence,
                            .destination_chain = envelope.destination_chain,
                            .message_id = message_id,
                            .kind = encoded.kind,
                            .payload = std::move(encoded.payload)});
  state_.put(sequence_key, sequence + 1);
  return transport_receipt{.sequence = sequence, .message_id = message_id};
}

std::vector<outbox_entry_t> outbox_transport::range(
    const agora::execution::state_view& state,
    const uint64_t from,
    const uint64_t to) {
  auto entries = std::vector<outbox_entry_t>{};
  for (auto sequence = std::max<uint64_t>(from, 1); sequence <= to;
       ++sequence) {
    auto entry = state.get<outbox_entry_t>(
        key::make_outbox_key(state.encoder(), sequence));
    if (!entry) {
      break;
    }
    entries.push_back(std::move(*entry));
  }
  return entries;
}

}  // namespace agora::crosschain
