#pragma once

#include <icnp/schema/execution_token.hpp>
#include <icnp/schema/primitives.hpp>

namespace icnp::schema {

void to_json(json_t& j, const token_limits_t& o);
void from_json(const json_t& j, token_limits_t& o);

void to_json(json_t& j, const binding_hash_t& o);
void from_json(const json_t& j, binding_hash_t& o);

void to_json(json_t& j, const token_binding_t& o);
void from_json(const json_t& j, token_binding_t& o);

// Instants are RFC3339 on the wire. The validity window is written nested
// under `validity`; `not_before`/`not_after` at the top level are also read.
void to_json(json_t& j, const execution_token<1>& o);
void from_json(const json_t& j, execution_token<1>& o);

/// The token as signed: every field except `signature`.
json_t make_signing_body(const execution_token<1>& token);

}  // namespace icnp::schema
