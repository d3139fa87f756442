#include <agora/blake3/hash.hpp>
#include <agora/crosschain/envelope_codec.hpp>

#include <algorithm>

using namespace agora::schema;

namespace agora::crosschain {

envelope_codec::envelope_codec(encoder_t& encoder) : encoder_{encoder} {}

encoded_envelope envelope_codec::encode(const envelope_t& envelope) const {
  return encoded_envelope{.kind = kind_of(envelope.message),
                          .payload = encoder_.encode(envelope)};
}

std::optional<envelope_t> envelope_codec::decode(
    const bytes_view_t& payload,
    const chain_id_t& local_chain,
    const address_t& local_receiver,
    std::string& error) const {
  if (payload.empty()) {
    error = "empty payload";
    return std::nullopt;
  }
  auto envelope = encoder_.try_decode<envelope_t>(payload);
  if (!envelope) {
    error = "undecodable envelope or unknown message kind";
    return std::nullopt;
  }
  if (envelope->version != 1) {
    error = "unsupported envelope version";
    return std::nullopt;
  }
  auto canonical = encoder_.encode(*envelope);
  if (!std::equal(std::begin(canonical), std::end(canonical),
                  std::begin(payload), std::end(payload))) {
    error = "non canonical envelope encoding";
    return std::nullopt;
  }
  if (envelope->destination_chain != local_chain) {
    error = "envelope addressed to another chain";
    return std::nullopt;
  }
  if (envelope->receiver != local_receiver) {
    error = "envelope addressed to another receiver";
    return std::nullopt;
  }
  return envelope;
}

message_id_t envelope_codec::message_id(const bytes_view_t& payload) {
  return agora::blake3::hash(payload);
}

}  // namespace agora::crosschain
