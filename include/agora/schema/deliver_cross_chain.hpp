#pragma once

#include <agora/schema/primitives.hpp>

// Schema type: deliver cross chain.
// Raw envelope bytes handed over by the relayer of the source chain route.
namespace agora::schema {

template <uint16_t Version>
struct deliver_cross_chain;

template <>
struct deliver_cross_chain<1> final {
  uint16_t version{1};
  bytes_t payload;
};

using deliver_cross_chain_t = deliver_cross_chain<1>;

}  // namespace agora::schema
