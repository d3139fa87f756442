#pragma once

#include <agora/schema/primitives.hpp>

// Schema type: upsert token balance.
// Administrator attested balance read by the membership oracle.
namespace agora::schema {

template <uint16_t Version>
struct upsert_token_balance;

template <>
struct upsert_token_balance<1> final {
  uint16_t version{1};
  token_id_t token{};
  address_t address{};
  amount_t balance{};
};

using upsert_token_balance_t = upsert_token_balance<1>;

}  // namespace agora::schema
