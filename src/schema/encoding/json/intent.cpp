#include <icnp/schema/encoding/json/intent.hpp>
#include <icnp/schema/encoding/json/primitives.hpp>

namespace icnp::schema {

void to_json(json_t& j, const risk_tolerance_t& o) {
  j = std::string{to_string(o)};
}

void from_json(const json_t& j, risk_tolerance_t& o) {
  o = encoding::json::enum_from_json<risk_tolerance_t>(j);
}

void to_json(json_t& j, const audit_level_t& o) {
  j = std::string{to_string(o)};
}

void from_json(const json_t& j, audit_level_t& o) {
  o = encoding::json::enum_from_json<audit_level_t>(j);
}

void to_json(json_t& j, const data_policy_t& o) {
  j = json_t::object();
  j["allowed_data_classes"] = o.allowed_data_classes;
  if (o.retention_days) {
    j["retention_days"] = *o.retention_days;
  }
}

void from_json(const json_t& j, data_policy_t& o) {
  o = data_policy_t{};
  encoding::json::read_or_default(j, "allowed_data_classes",
                                  o.allowed_data_classes);
  const auto it = j.find("retention_days");
  if (it != j.end() && !it->is_null()) {
    o.retention_days = encoding::json::count_from_json(*it);
  }
}

void to_json(json_t& j, const intent_constraints_t& o) {
  j = json_t::object();
  j["risk_tolerance"] = o.risk_tolerance;
  j["human_approval_required"] = o.human_approval_required;
  j["data_policy"] = o.data_policy;
  j["external_side_effects_allowed"] = o.external_side_effects_allowed;
  j["audit_level"] = o.audit_level;
}

void from_json(const json_t& j, intent_constraints_t& o) {
  if (!j.is_object()) {
    throw std::invalid_argument("constraints must be an object");
  }
  o = intent_constraints_t{};
  encoding::json::read_or_default(j, "risk_tolerance", o.risk_tolerance);
  encoding::json::read_or_default(j, "human_approval_required",
                                  o.human_approval_required);
  encoding::json::read_or_default(j, "data_policy", o.data_policy);
  encoding::json::read_or_default(j, "external_side_effects_allowed",
                                  o.external_side_effects_allowed);
  encoding::json::read_or_default(j, "audit_level", o.audit_level);
}

void to_json(json_t& j, const requested_action_t& o) {
  j = json_t::object();
  j["action"] = o.action;
  encoding::json::write_optional(j, "description", o.description);
}

void from_json(const json_t& j, requested_action_t& o) {
  o.action = encoding::json::require_string(j, "action");
  encoding::json::read_optional(j, "description", o.description);
}

void to_json(json_t& j, const intent<1>& o) {
  j = json_t::object();
  j["goal"] = o.goal;
  j["requested_actions"] = o.requested_actions;
  if (!o.expected_outputs.empty()) {
    j["expected_outputs"] = o.expected_outputs;
  }
}

// Goal and requested actions are optional here so that an incomplete intent
// reaches the registry and is rejected there as an invalid intent.
void from_json(const json_t& j, intent<1>& o) {
  if (!j.is_object()) {
    throw std::invalid_argument("intent must be an object");
  }
  o = intent<1>{};
  encoding::json::read_or_default(j, "goal", o.goal);
  encoding::json::read_or_default(j, "requested_actions", o.requested_actions);
  encoding::json::read_or_default(j, "expected_outputs", o.expected_outputs);
  encoding::json::read_or_default(j, "constraints", o.constraints);
}

}  // namespace icnp::schema
