#pragma once

#include <agora/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: message kind.
// Values match the variant index of cross_chain_message_t, which is the tag
// written on the wire.
namespace agora::schema {

enum class message_kind_t : uint8_t {
  create_proposal = 0,
  vote = 1,
  finalize = 2
};

template <>
struct enum_names<message_kind_t> final {
  static constexpr auto entries = std::array{
      enum_entry_t<message_kind_t>{"create_proposal",
                                   message_kind_t::create_proposal},
      enum_entry_t<message_kind_t>{"vote", message_kind_t::vote},
      enum_entry_t<message_kind_t>{"finalize", message_kind_t::finalize}};
};

inline constexpr std::string_view to_string(const message_kind_t value) {
  return enum_name(value);
}

}  // namespace agora::schema
