#pragma once

#include <icnp/schema/audit_event.hpp>
#include <icnp/schema/primitives.hpp>

namespace icnp::schema {

void to_json(json_t& j, const audit_event_kind_t& o);
void from_json(const json_t& j, audit_event_kind_t& o);

void to_json(json_t& j, const audit_severity_t& o);
void from_json(const json_t& j, audit_severity_t& o);

void to_json(json_t& j, const audit_event<1>& o);
void from_json(const json_t& j, audit_event<1>& o);

}  // namespace icnp::schema
