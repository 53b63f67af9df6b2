#pragma once

#include <icnp/schema/capability.hpp>
#include <icnp/schema/primitives.hpp>

namespace icnp::schema {

void to_json(json_t& j, const capability_action_t& o);
void from_json(const json_t& j, capability_action_t& o);

void to_json(json_t& j, const capability<1>& o);
void from_json(const json_t& j, capability<1>& o);

}  // namespace icnp::schema
