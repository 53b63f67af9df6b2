#pragma once

#include <icnp/schema/intent.hpp>
#include <icnp/schema/primitives.hpp>

namespace icnp::schema {

void to_json(json_t& j, const risk_tolerance_t& o);
void from_json(const json_t& j, risk_tolerance_t& o);

void to_json(json_t& j, const audit_level_t& o);
void from_json(const json_t& j, audit_level_t& o);

void to_json(json_t& j, const data_policy_t& o);
void from_json(const json_t& j, data_policy_t& o);

void to_json(json_t& j, const intent_constraints_t& o);
void from_json(const json_t& j, intent_constraints_t& o);

void to_json(json_t& j, const requested_action_t& o);
void from_json(const json_t& j, requested_action_t& o);

// Goal, requested actions and expected outputs only; constraints travel
// beside the intent in the declaration payload.
void to_json(json_t& j, const intent<1>& o);
void from_json(const json_t& j, intent<1>& o);

}  // namespace icnp::schema
