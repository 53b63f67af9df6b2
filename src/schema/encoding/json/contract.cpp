#include <icnp/schema/encoding/json/actor.hpp>
#include <icnp/schema/encoding/json/contract.hpp>
#include <icnp/schema/encoding/json/intent.hpp>
#include <icnp/schema/encoding/json/primitives.hpp>

namespace icnp::schema {

void to_json(json_t& j, const enforcement_mode_t& o) {
  j = std::string{to_string(o)};
}

void from_json(const json_t& j, enforcement_mode_t& o) {
  o = encoding::json::enum_from_json<enforcement_mode_t>(j);
}

void to_json(json_t& j, const violation_action_t& o) {
  j = std::string{to_string(o)};
}

void from_json(const json_t& j, violation_action_t& o) {
  o = encoding::json::enum_from_json<violation_action_t>(j);
}

void to_json(json_t& j, const approval_decision_t& o) {
  j = std::string{to_string(o)};
}

void from_json(const json_t& j, approval_decision_t& o) {
  o = encoding::json::enum_from_json<approval_decision_t>(j);
}

void to_json(json_t& j, const agreed_action_t& o) {
  j = json_t::object();
  j["action_id"] = o.action_id;
  j["capability_id"] = o.capability_id;
  j["executor_id"] = o.executor_id;
  j["action"] = o.action;
  j["scope"] = o.scope;
  if (o.max_invocations) {
    j["max_invocations"] = *o.max_invocations;
  }
}

void from_json(const json_t& j, agreed_action_t& o) {
  o = agreed_action_t{};
  encoding::json::read_or_default(j, "action_id", o.action_id);
  o.capability_id = encoding::json::require_string(j, "capability_id");
  o.executor_id = encoding::json::require_string(j, "executor_id");
  o.action = encoding::json::require_string(j, "action");
  encoding::json::read_or_default(j, "scope", o.scope);
  const auto it = j.find("max_invocations");
  if (it != j.end() && !it->is_null()) {
    o.max_invocations = encoding::json::count_from_json(*it);
  }
}

void to_json(json_t& j, const forbidden_action_t& o) {
  j = json_t::object();
  j["action"] = o.action;
  encoding::json::write_optional(j, "scope", o.scope);
  encoding::json::write_optional(j, "reason", o.reason);
}

void from_json(const json_t& j, forbidden_action_t& o) {
  o = forbidden_action_t{};
  o.action = encoding::json::require_string(j, "action");
  encoding::json::read_optional(j, "scope", o.scope);
  encoding::json::read_optional(j, "reason", o.reason);
}

void to_json(json_t& j, const enforcement_t& o) {
  j = json_t::object();
  j["mode"] = o.mode;
  j["violation_action"] = o.violation_action;
  j["audit_level"] = o.audit_level;
  j["logging_required"] = o.logging_required;
  j["rollback_required"] = o.rollback_required;
}

void from_json(const json_t& j, enforcement_t& o) {
  if (!j.is_object()) {
    throw std::invalid_argument("enforcement must be an object");
  }
  o = enforcement_t{};
  encoding::json::read_or_default(j, "mode", o.mode);
  encoding::json::read_or_default(j, "violation_action", o.violation_action);
  encoding::json::read_or_default(j, "audit_level", o.audit_level);
  encoding::json::read_or_default(j, "logging_required", o.logging_required);
  encoding::json::read_or_default(j, "rollback_required", o.rollback_required);
}

void to_json(json_t& j, const approval_t& o) {
  j = json_t::object();
  j["approver"] = o.approver;
  j["decision"] = o.decision;
  j["decided_at"] = o.decided_at;
  encoding::json::write_optional(j, "note", o.note);
}

void from_json(const json_t& j, approval_t& o) {
  o = approval_t{};
  o.approver = encoding::json::require(j, "approver").get<actor_t>();
  o.decision =
      encoding::json::require(j, "decision").get<approval_decision_t>();
  encoding::json::read_or_default(j, "decided_at", o.decided_at);
  encoding::json::read_optional(j, "note", o.note);
}

void to_json(json_t& j, const signature_t& o) {
  j = json_t::object();
  j["alg"] = o.alg;
  j["value"] = o.value;
  j["key_id"] = o.key_id;
  j["signed_by"] = o.signed_by;
  j["signed_at"] = o.signed_at;
}

void from_json(const json_t& j, signature_t& o) {
  o = signature_t{};
  o.alg = encoding::json::require_string(j, "alg");
  o.value = encoding::json::require_string(j, "value");
  encoding::json::read_or_default(j, "key_id", o.key_id);
  encoding::json::read_or_default(j, "signed_by", o.signed_by);
  encoding::json::read_or_default(j, "signed_at", o.signed_at);
}

void to_json(json_t& j, const contract<1>& o) {
  j = json_t::object();
  j["contract_id"] = o.contract_id;
  j["session_id"] = o.session_id;
  encoding::json::write_optional(j, "issued_at", o.issued_at);
  j["parties"] = o.parties;
  j["agreed_actions"] = o.agreed_actions;
  j["forbidden_actions"] = o.forbidden_actions;
  j["constraints"] = o.constraints;
  j["enforcement"] = o.enforcement;
  j["approvals"] = o.approvals;
  auto signatures = json_t::object();
  for (const auto& [signer, signature] : o.signatures) {
    signatures[signer] = signature;
  }
  j["signatures"] = std::move(signatures);
}

void from_json(const json_t& j, contract<1>& o) {
  o = contract<1>{};
  o.contract_id = encoding::json::require_string(j, "contract_id");
  o.session_id = encoding::json::require_string(j, "session_id");
  encoding::json::read_optional(j, "issued_at", o.issued_at);
  encoding::json::read_or_default(j, "parties", o.parties);
  encoding::json::read_or_default(j, "agreed_actions", o.agreed_actions);
  encoding::json::read_or_default(j, "forbidden_actions", o.forbidden_actions);
  encoding::json::read_or_default(j, "constraints", o.constraints);
  if (!o.constraints.is_object()) {
    throw std::invalid_argument("contract constraints must be an object");
  }
  encoding::json::read_or_default(j, "enforcement", o.enforcement);
  encoding::json::read_or_default(j, "approvals", o.approvals);

  const auto it = j.find("signatures");
  if (it == j.end() || it->is_null()) {
    return;
  }
  if (it->is_object()) {
    for (const auto& [signer, value] : it->items()) {
      o.signatures[signer] = value.get<signature_t>();
    }
  } else if (it->is_array()) {
    for (const auto& value : *it) {
      auto signature = value.get<signature_t>();
      if (signature.signed_by.empty()) {
        throw std::invalid_argument("signature without 'signed_by'");
      }
      auto signer = signature.signed_by;
      o.signatures[signer] = std::move(signature);
    }
  } else {
    throw std::invalid_argument("'signatures' must be an object or array");
  }
}

}  // namespace icnp::schema
