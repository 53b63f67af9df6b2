#include <icnp/schema/encoding/json/capability.hpp>
#include <icnp/schema/encoding/json/primitives.hpp>

namespace icnp::schema {

void to_json(json_t& j, const capability_action_t& o) {
  j = json_t::object();
  j["action"] = o.action;
  j["scopes"] = o.scopes;
  j["requires_approval"] = o.requires_approval;
  j["confidence"] = o.confidence;
  j["effects"] = o.effects;
}

void from_json(const json_t& j, capability_action_t& o) {
  o = capability_action_t{};
  o.action = encoding::json::require_string(j, "action");
  encoding::json::read_or_default(j, "scopes", o.scopes);
  encoding::json::read_or_default(j, "requires_approval", o.requires_approval);
  const auto& confidence = encoding::json::require(j, "confidence");
  if (!confidence.is_number()) {
    throw std::invalid_argument("field 'confidence' must be a number");
  }
  o.confidence = confidence.get<double>();
  encoding::json::read_or_default(j, "effects", o.effects);
}

void to_json(json_t& j, const capability<1>& o) {
  j = json_t::object();
  j["capability_id"] = o.capability_id;
  encoding::json::write_optional(j, "name", o.name);
  encoding::json::write_optional(j, "description", o.description);
  j["actions"] = o.actions;
}

void from_json(const json_t& j, capability<1>& o) {
  o = capability<1>{};
  o.capability_id = encoding::json::require_string(j, "capability_id");
  encoding::json::read_optional(j, "name", o.name);
  encoding::json::read_optional(j, "description", o.description);
  o.actions = encoding::json::require(j, "actions")
                  .get<std::vector<capability_action_t>>();
}

}  // namespace icnp::schema
