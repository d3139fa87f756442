#pragma once

#include <agora/schema/primitives.hpp>
#include <optional>

// Schema type: register DAO.
// The attached fee must cover the configured creation fee.
namespace agora::schema {

template <uint16_t Version>
struct register_dao;

template <>
struct register_dao<1> final {
  uint16_t version{1};
  dao_id_t dao_id{};
  bytes_t name;
  bytes_t description;
  std::optional<hash32_t> metadata_ref;
  token_id_t governance_token{};
  amount_t minimum_tokens{};
  amount_t fee{};
};

using register_dao_t = register_dao<1>;

}  // namespace agora::schema
