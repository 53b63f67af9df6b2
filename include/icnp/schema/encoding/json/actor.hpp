#pragma once

#include <icnp/schema/actor.hpp>
#include <icnp/schema/primitives.hpp>

namespace icnp::schema {

void to_json(json_t& j, const actor_role_t& o);
void from_json(const json_t& j, actor_role_t& o);

void to_json(json_t& j, const actor_t& o);
void from_json(const json_t& j, actor_t& o);

}  // namespace icnp::schema
