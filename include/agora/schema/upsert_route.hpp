#pragma once

#include <agora/schema/primitives.hpp>

// Schema type: upsert route.
// Also the stored route record.
namespace agora::schema {

template <uint16_t Version>
struct upsert_route;

template <>
struct upsert_route<1> final {
  uint16_t version{1};
  chain_id_t chain{};
  address_t receiver{};
  address_t relayer{};
  bool enabled{};
};

using upsert_route_t = upsert_route<1>;

}  // namespace agora::schema
