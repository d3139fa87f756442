#pragma once

#include <agora/schema/encoding/scale/encoder.hpp>
#include <agora/schema/envelope.hpp>
#include <agora/schema/message_kind.hpp>
#include <agora/schema/primitives.hpp>
#include <optional>
#include <string>

namespace agora::crosschain {

struct encoded_envelope final {
  agora::schema::message_kind_t kind{};
  agora::schema::bytes_t payload;
};

/// Wire codec for cross-chain envelopes.
///
/// The message variant index is written before the message fields, so the
/// kind is known before any field is interpreted.  Only canonical encodings
/// are accepted: re-encoding a decoded envelope must reproduce the input
/// exactly, which rules out trailing bytes.
class envelope_codec final {
 public:
  using encoder_t = agora::schema::encoding::encoder<
      agora::schema::encoding::scale_encoder_tag>;

  explicit envelope_codec(encoder_t& encoder);

  encoded_envelope encode(const agora::schema::envelope_t& envelope) const;

  /// Decode an inbound payload addressed to this chain.
  ///
  /// Fails, with `error` describing why, on an unknown tag, an unsupported
  /// version, a non canonical encoding, or a destination or receiver other
  /// than `local_chain` and `local_receiver`.
  std::optional<agora::schema::envelope_t> decode(
      const agora::schema::bytes_view_t& payload,
      const agora::schema::chain_id_t& local_chain,
      const agora::schema::address_t& local_receiver,
      std::string& error) const;

  /// Dedup key of an envelope: BLAKE3 over its canonical encoding.
  static agora::schema::message_id_t message_id(
      const agora::schema::bytes_view_t& payload);

 private:
  encoder_t& encoder_;
};

}  // namespace agora::crosschain
