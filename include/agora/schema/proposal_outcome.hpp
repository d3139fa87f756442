#pragma once

#include <agora/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace agora::schema {

enum class proposal_outcome_t : uint8_t { passed = 0, quorum_not_met = 1 };

template <>
struct enum_names<proposal_outcome_t> final {
  static constexpr auto entries = std::array{
      enum_entry_t<proposal_outcome_t>{"passed", proposal_outcome_t::passed},
      enum_entry_t<proposal_outcome_t>{"quorum_not_met",
                                       proposal_outcome_t::quorum_not_met}};
};

inline constexpr std::string_view to_string(const proposal_outcome_t value) {
  return enum_name(value);
}

}  // namespace agora::schema
