#pragma once

#include <agora/schema/primitives.hpp>

namespace agora::schema {

template <uint16_t Version>
struct upsert_whitelist;

template <>
struct upsert_whitelist<1> final {
  uint16_t version{1};
  address_t address{};
  bool whitelisted{};
};

using upsert_whitelist_t = upsert_whitelist<1>;

}  // namespace agora::schema
