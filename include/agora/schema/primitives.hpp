#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace agora::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;

// Identifiers are opaque 32 byte values.  Chain identifiers follow the same
// shape so envelopes and routes stay fixed width.
using address_t = hash32_t;
using dao_id_t = hash32_t;
using proposal_id_t = hash32_t;
using chain_id_t = hash32_t;
using token_id_t = hash32_t;
using message_id_t = hash32_t;

using amount_t = boost::multiprecision::uint256_t;
using weight_t = uint64_t;
using timestamp_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);
bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_view_t& bytes);
/// Accepts 64 hex digits (optionally 0x prefixed) or a raw 32 character
/// label, which is right padded with zero bytes.
std::optional<hash32_t> try_make_hash32(const std::string_view& text);
hash32_t make_zero_hash();
bool is_zero(const hash32_t& hash);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
std::string to_base64(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base64(std::string_view encoded);

std::optional<amount_t> try_make_amount(std::string_view text);

struct ed25519_signer_id final {
  std::array<uint8_t, 32> public_key;
  bool operator==(const ed25519_signer_id&) const = default;
};

struct secp256k1_signer_id final {
  std::array<uint8_t, 33> public_key;
  bool operator==(const secp256k1_signer_id&) const = default;
};

using named_signer_t = hash32_t;
using signer_id_t =
    std::variant<ed25519_signer_id, secp256k1_signer_id, named_signer_t>;

using ed25519_signature_t = std::array<uint8_t, 64>;
using secp256k1_signature_t = std::array<uint8_t, 65>;
using signature_t = std::variant<ed25519_signature_t, secp256k1_signature_t>;

}  // namespace agora::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
