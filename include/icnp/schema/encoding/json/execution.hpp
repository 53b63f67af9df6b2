#pragma once

#include <icnp/schema/execution.hpp>
#include <icnp/schema/primitives.hpp>

namespace icnp::schema {

void to_json(json_t& j, const execution_status_t& o);
void from_json(const json_t& j, execution_status_t& o);

// `executor` is an actor object; a bare id string is read as an agent.
void to_json(json_t& j, const execution_request<1>& o);
void from_json(const json_t& j, execution_request<1>& o);

void to_json(json_t& j, const execution_result<1>& o);
void from_json(const json_t& j, execution_result<1>& o);

}  // namespace icnp::schema
