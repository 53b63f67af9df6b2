#pragma once

#include <icnp/schema/contract.hpp>
#include <icnp/schema/primitives.hpp>

namespace icnp::schema {

void to_json(json_t& j, const enforcement_mode_t& o);
void from_json(const json_t& j, enforcement_mode_t& o);

void to_json(json_t& j, const violation_action_t& o);
void from_json(const json_t& j, violation_action_t& o);

void to_json(json_t& j, const approval_decision_t& o);
void from_json(const json_t& j, approval_decision_t& o);

void to_json(json_t& j, const agreed_action_t& o);
void from_json(const json_t& j, agreed_action_t& o);

void to_json(json_t& j, const forbidden_action_t& o);
void from_json(const json_t& j, forbidden_action_t& o);

void to_json(json_t& j, const enforcement_t& o);
void from_json(const json_t& j, enforcement_t& o);

void to_json(json_t& j, const approval_t& o);
void from_json(const json_t& j, approval_t& o);

void to_json(json_t& j, const signature_t& o);
void from_json(const json_t& j, signature_t& o);

// `signatures` is written as an object keyed by signer id. Both that form and
// an array of signatures (keyed by `signed_by`) are read.
void to_json(json_t& j, const contract<1>& o);
void from_json(const json_t& j, contract<1>& o);

}  // namespace icnp::schema
