#include <icnp/common/time.hpp>
#include <icnp/schema/encoding/json/actor.hpp>
#include <icnp/schema/encoding/json/contract.hpp>
#include <icnp/schema/encoding/json/execution_token.hpp>
#include <icnp/schema/encoding/json/primitives.hpp>

namespace icnp::schema {

namespace {

timestamp_milliseconds_t require_instant(const json_t& j,
                                         const std::string& key) {
  const auto text = encoding::json::require_string(j, key);
  const auto parsed = common::parse_rfc3339(text);
  if (!parsed) {
    throw std::invalid_argument("field '" + key + "' is not RFC3339");
  }
  return *parsed;
}

}  // namespace

void to_json(json_t& j, const token_limits_t& o) {
  j = json_t::object();
  j["max_invocations_per_actor"] = o.max_invocations_per_actor;
  if (o.max_invocations_total) {
    j["max_invocations_total"] = *o.max_invocations_total;
  }
}

void from_json(const json_t& j, token_limits_t& o) {
  o = token_limits_t{};
  o.max_invocations_per_actor = encoding::json::count_from_json(
      encoding::json::require(j, "max_invocations_per_actor"));
  const auto it = j.find("max_invocations_total");
  if (it != j.end() && !it->is_null()) {
    o.max_invocations_total = encoding::json::count_from_json(*it);
  }
}

void to_json(json_t& j, const binding_hash_t& o) {
  j = json_t::object();
  j["alg"] = o.alg;
  j["value"] = o.value;
}

void from_json(const json_t& j, binding_hash_t& o) {
  o.alg = encoding::json::require_string(j, "alg");
  o.value = encoding::json::require_string(j, "value");
}

void to_json(json_t& j, const token_binding_t& o) {
  j = json_t::object();
  j["intent_hash"] = o.intent_hash;
  j["contract_hash"] = o.contract_hash;
  j["capabilities_hash"] = o.capabilities_hash;
}

void from_json(const json_t& j, token_binding_t& o) {
  o.intent_hash = encoding::json::require(j, "intent_hash").get<binding_hash_t>();
  o.contract_hash =
      encoding::json::require(j, "contract_hash").get<binding_hash_t>();
  o.capabilities_hash =
      encoding::json::require(j, "capabilities_hash").get<binding_hash_t>();
}

json_t make_signing_body(const execution_token<1>& token) {
  auto j = json_t::object();
  j["token_id"] = token.token_id;
  j["session_id"] = token.session_id;
  j["contract_id"] = token.contract_id;
  j["issuer"] = token.issuer;
  j["audience"] = token.audience;
  j["issued_at"] = common::format_rfc3339(token.issued_at);
  j["validity"] = json_t{
      {"not_before", common::format_rfc3339(token.validity.not_before)},
      {"not_after", common::format_rfc3339(token.validity.not_after)}};
  j["limits"] = token.limits;
  j["binding"] = token.binding;
  j["revocation"] = json_t{{"method", token.revocation_method}};
  return j;
}

void to_json(json_t& j, const execution_token<1>& o) {
  j = make_signing_body(o);
  if (o.signature) {
    j["signature"] = *o.signature;
  }
}

void from_json(const json_t& j, execution_token<1>& o) {
  o = execution_token<1>{};
  o.token_id = encoding::json::require_string(j, "token_id");
  o.session_id = encoding::json::require_string(j, "session_id");
  o.contract_id = encoding::json::require_string(j, "contract_id");
  o.issuer = encoding::json::require(j, "issuer").get<actor_t>();
  encoding::json::read_or_default(j, "audience", o.audience);
  o.issued_at = require_instant(j, "issued_at");

  const auto validity = j.find("validity");
  const auto& window =
      (validity != j.end() && validity->is_object()) ? *validity : j;
  o.validity.not_before = require_instant(window, "not_before");
  o.validity.not_after = require_instant(window, "not_after");

  o.limits = encoding::json::require(j, "limits").get<token_limits_t>();
  o.binding = encoding::json::require(j, "binding").get<token_binding_t>();

  const auto revocation = j.find("revocation");
  if (revocation != j.end() && revocation->is_object()) {
    encoding::json::read_or_default(*revocation, "method",
                                    o.revocation_method);
  }
  encoding::json::read_optional(j, "signature", o.signature);
}

}  // namespace icnp::schema
