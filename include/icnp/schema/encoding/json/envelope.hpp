#pragma once

#include <icnp/schema/envelope.hpp>
#include <icnp/schema/primitives.hpp>

namespace icnp::schema {

void to_json(json_t& j, const message_type_t& o);
void from_json(const json_t& j, message_type_t& o);

void to_json(json_t& j, const message_phase_t& o);
void from_json(const json_t& j, message_phase_t& o);

void to_json(json_t& j, const envelope<1>& o);
void from_json(const json_t& j, envelope<1>& o);

}  // namespace icnp::schema
