#pragma once

#include <agora/schema/primitives.hpp>
#include <variant>

namespace agora::schema {

struct local_source_t final {};

struct remote_source_t final {
  chain_id_t chain{};
  uint64_t sequence{};
  message_id_t message_id{};
};

using vote_source_t = std::variant<local_source_t, remote_source_t>;

}  // namespace agora::schema
