#pragma once

#include <agora/schema/primitives.hpp>
#include <agora/schema/transaction_event.hpp>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace agora::governance {

using event_attribute_t = std::pair<std::string_view, std::string>;

agora::schema::transaction_event_t make_event(
    std::string_view type,
    std::initializer_list<event_attribute_t> attributes);

std::string attribute(const agora::schema::hash32_t& value);
std::string attribute(const agora::schema::amount_t& value);
std::string attribute(uint64_t value);
std::string attribute(bool value);

}  // namespace agora::governance
