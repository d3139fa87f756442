#pragma once
#include <agora/common/critical.hpp>
#include <agora/schema/app_info.hpp>
#include <agora/schema/applied_message.hpp>
#include <agora/schema/dao_record.hpp>
#include <agora/schema/encoding/encoder.hpp>
#include <agora/schema/envelope.hpp>
#include <agora/schema/event_record.hpp>
#include <agora/schema/fee_ledger_state.hpp>
#include <agora/schema/governance_parameters.hpp>
#include <agora/schema/history_entry.hpp>
#include <agora/schema/outbox_entry.hpp>
#include <agora/schema/proposal_snapshot.hpp>
#include <agora/schema/proposal_state.hpp>
#include <agora/schema/route_state.hpp>
#include <agora/schema/transaction.hpp>
#include <agora/schema/vote_tally.hpp>
#include <iterator>
#include <scale/scale.hpp>

// Schema structs are aggregates; the codec decomposes them field by field in
// declaration order, so field order is the wire format.
namespace agora::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  agora::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, agora::schema::bytes_t& out);

  template <typename T>
  T decode(const agora::schema::bytes_view_t& bytes);

  /// Decode bytes as T; std::nullopt when the input is not a valid encoding.
  /// Trailing bytes are not rejected here, callers that need canonical input
  /// re-encode and compare.
  template <typename T>
  std::optional<T> try_decode(const agora::schema::bytes_view_t& bytes);
};

template <typename T>
agora::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    agora::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        agora::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const agora::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    agora::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const agora::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace agora::schema::encoding
