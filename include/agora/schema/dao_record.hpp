#pragma once

#include <agora/schema/primitives.hpp>
#include <optional>

// Schema type: DAO record.
// Append only; the controller is fixed at registration.
namespace agora::schema {

template <uint16_t Version>
struct dao_record;

template <>
struct dao_record<1> final {
  uint16_t version{1};
  dao_id_t dao_id{};
  address_t controller{};
  bytes_t name;
  bytes_t description;
  std::optional<hash32_t> metadata_ref;
  token_id_t governance_token{};
  amount_t minimum_tokens{};
  timestamp_t created_at{};
};

using dao_record_t = dao_record<1>;

}  // namespace agora::schema
