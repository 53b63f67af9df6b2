#include <icnp/schema/encoding/json/actor.hpp>
#include <icnp/schema/encoding/json/execution.hpp>
#include <icnp/schema/encoding/json/primitives.hpp>

namespace icnp::schema {

void to_json(json_t& j, const execution_status_t& o) {
  j = std::string{to_string(o)};
}

void from_json(const json_t& j, execution_status_t& o) {
  o = encoding::json::enum_from_json<execution_status_t>(j);
}

void to_json(json_t& j, const execution_request<1>& o) {
  j = json_t::object();
  j["invocation_id"] = o.invocation_id;
  j["token_id"] = o.token_id;
  j["contract_id"] = o.contract_id;
  j["action"] = o.action;
  j["executor"] = o.executor;
  encoding::json::write_optional(j, "scope", o.scope);
  encoding::json::write_optional(j, "nonce", o.nonce);
  encoding::json::write_optional(j, "requested_at", o.requested_at);
  j["parameters"] = o.parameters;
}

void from_json(const json_t& j, execution_request<1>& o) {
  o = execution_request<1>{};
  o.invocation_id = encoding::json::require_string(j, "invocation_id");
  o.token_id = encoding::json::require_string(j, "token_id");
  o.contract_id = encoding::json::require_string(j, "contract_id");
  o.action = encoding::json::require_string(j, "action");
  const auto& executor = encoding::json::require(j, "executor");
  if (executor.is_string()) {
    o.executor = actor_t{.id = executor.get<std::string>(),
                         .role = actor_role_t::agent,
                         .display_name = std::nullopt};
  } else {
    o.executor = executor.get<actor_t>();
  }
  encoding::json::read_optional(j, "scope", o.scope);
  encoding::json::read_optional(j, "nonce", o.nonce);
  encoding::json::read_optional(j, "requested_at", o.requested_at);
  encoding::json::read_or_default(j, "parameters", o.parameters);
}

void to_json(json_t& j, const execution_result<1>& o) {
  j = json_t::object();
  j["invocation_id"] = o.invocation_id;
  j["token_id"] = o.token_id;
  j["contract_id"] = o.contract_id;
  j["status"] = o.status;
  encoding::json::write_optional(j, "started_at", o.started_at);
  encoding::json::write_optional(j, "ended_at", o.ended_at);
  encoding::json::write_optional(j, "output", o.output);
}

void from_json(const json_t& j, execution_result<1>& o) {
  o = execution_result<1>{};
  o.invocation_id = encoding::json::require_string(j, "invocation_id");
  encoding::json::read_or_default(j, "token_id", o.token_id);
  encoding::json::read_or_default(j, "contract_id", o.contract_id);
  o.status = encoding::json::require(j, "status").get<execution_status_t>();
  encoding::json::read_optional(j, "started_at", o.started_at);
  encoding::json::read_optional(j, "ended_at", o.ended_at);
  encoding::json::read_optional(j, "output", o.output);
}

}  // namespace icnp::schema
