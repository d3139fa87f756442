#include <agora/governance/events.hpp>

namespace agora::governance {

agora::schema::transaction_event_t make_event(
    const std::string_view type,
    const std::initializer_list<event_attribute_t> attributes) {
  auto event = agora::schema::transaction_event_t{};
  event.type = std::string{type};
  event.attributes.reserve(attributes.size());
  for (const auto& [key, value] : attributes) {
    event.attributes.push_back(agora::schema::transaction_event_attribute_t{
        .key = std::string{key}, .value = value, .index = true});
  }
  return event;
}

std::string attribute(const agora::schema::hash32_t& value) {
  return agora::schema::to_hex(agora::schema::bytes_view_t{value});
}

std::string attribute(const agora::schema::amount_t& value) {
  return value.str();
}

std::string attribute(const uint64_t value) {
  return std::to_string(value);
}

std::string attribute(const bool value) {
  return value ? "true" : "false";
}

}  // namespace agora::governance
