#pragma once

#include <agora/schema/upsert_route.hpp>

namespace agora::schema {

using route_state_t = upsert_route_t;

}  // namespace agora::schema
