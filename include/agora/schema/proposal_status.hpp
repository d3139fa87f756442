#pragma once

#include <agora/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: proposal status.
// Derived from the voting window and the terminal flag; never persisted.
namespace agora::schema {

enum class proposal_status_t : uint8_t {
  pending = 0,
  active = 1,
  ended = 2,
  finalized = 3
};

template <>
struct enum_names<proposal_status_t> final {
  static constexpr auto entries = std::array{
      enum_entry_t<proposal_status_t>{"pending", proposal_status_t::pending},
      enum_entry_t<proposal_status_t>{"active", proposal_status_t::active},
      enum_entry_t<proposal_status_t>{"ended", proposal_status_t::ended},
      enum_entry_t<proposal_status_t>{"finalized",
                                      proposal_status_t::finalized}};
};

inline constexpr std::string_view to_string(const proposal_status_t value) {
  return enum_name(value);
}

}  // namespace agora::schema
