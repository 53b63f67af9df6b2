#include <icnp/schema/encoding/json/capability.hpp>
#include <icnp/schema/encoding/json/contract.hpp>
#include <icnp/schema/encoding/json/execution.hpp>
#include <icnp/schema/encoding/json/execution_token.hpp>
#include <icnp/schema/encoding/json/intent.hpp>
#include <icnp/schema/encoding/json/payload.hpp>
#include <icnp/schema/encoding/json/primitives.hpp>

namespace icnp::schema {

namespace {

template <typename T>
message_payload_t decode_as(const json_t& document) {
  auto result = T{};
  from_json(document, result);
  return result;
}

}  // namespace

void to_json(json_t& j, const acceptance_decision_t& o) {
  j = std::string{to_string(o)};
}

void from_json(const json_t& j, acceptance_decision_t& o) {
  o = encoding::json::enum_from_json<acceptance_decision_t>(j);
}

void to_json(json_t& j, const intent_declaration_t& o) {
  j = json_t::object();
  j["intent"] = o.intent;
  j["constraints"] = o.intent.constraints;
}

void from_json(const json_t& j, intent_declaration_t& o) {
  o.intent = encoding::json::require(j, "intent").get<intent_t>();
  encoding::json::read_or_default(j, "constraints", o.intent.constraints);
}

void to_json(json_t& j, const capability_disclosure_t& o) {
  j = json_t::object();
  j["capabilities"] = o.capabilities;
}

void from_json(const json_t& j, capability_disclosure_t& o) {
  o.capabilities = encoding::json::require(j, "capabilities")
                       .get<std::vector<capability_t>>();
}

void to_json(json_t& j, const contract_proposal_t& o) {
  j = json_t::object();
  j["contract"] = o.contract;
}

void from_json(const json_t& j, contract_proposal_t& o) {
  o.contract = encoding::json::require(j, "contract").get<contract_t>();
}

void to_json(json_t& j, const contract_counterproposal_t& o) {
  j = json_t::object();
  j["contract"] = o.contract;
  encoding::json::write_optional(j, "reason", o.reason);
}

void from_json(const json_t& j, contract_counterproposal_t& o) {
  o.contract = encoding::json::require(j, "contract").get<contract_t>();
  encoding::json::read_optional(j, "reason", o.reason);
}

void to_json(json_t& j, const contract_acceptance_t& o) {
  j = json_t::object();
  encoding::json::write_optional(j, "contract_id", o.contract_id);
  encoding::json::write_optional(j, "contract", o.contract);
  j["decision"] = o.decision;
  encoding::json::write_optional(j, "signature", o.signature);
  encoding::json::write_optional(j, "reason", o.reason);
}

void from_json(const json_t& j, contract_acceptance_t& o) {
  o = contract_acceptance_t{};
  encoding::json::read_optional(j, "contract_id", o.contract_id);
  encoding::json::read_optional(j, "contract", o.contract);
  if (!o.contract_id && !o.contract) {
    throw std::invalid_argument("acceptance names no contract");
  }
  o.decision =
      encoding::json::require(j, "decision").get<acceptance_decision_t>();
  encoding::json::read_optional(j, "signature", o.signature);
  encoding::json::read_optional(j, "reason", o.reason);
}

void to_json(json_t& j, const contract_rejection_t& o) {
  j = json_t::object();
  j["contract_id"] = o.contract_id;
  encoding::json::write_optional(j, "reason", o.reason);
}

void from_json(const json_t& j, contract_rejection_t& o) {
  o.contract_id = encoding::json::require_string(j, "contract_id");
  encoding::json::read_optional(j, "reason", o.reason);
}

void to_json(json_t& j, const execution_token_message_t& o) {
  j = json_t::object();
  j["token"] = o.token;
}

void from_json(const json_t& j, execution_token_message_t& o) {
  o.token = encoding::json::require(j, "token").get<execution_token_t>();
}

void to_json(json_t& j, const execution_request_message_t& o) {
  j = json_t::object();
  j["request"] = o.request;
}

void from_json(const json_t& j, execution_request_message_t& o) {
  o.request =
      encoding::json::require(j, "request").get<execution_request_t>();
}

void to_json(json_t& j, const execution_result_message_t& o) {
  j = json_t::object();
  j["result"] = o.result;
}

void from_json(const json_t& j, execution_result_message_t& o) {
  o.result = encoding::json::require(j, "result").get<execution_result_t>();
}

void to_json(json_t& j, const audit_event_message_t& o) {
  j = json_t::object();
  j["event"] = o.event;
}

void from_json(const json_t& j, audit_event_message_t& o) {
  o.event = encoding::json::require(j, "event");
  if (!o.event.is_object()) {
    throw std::invalid_argument("field 'event' must be an object");
  }
}

void to_json(json_t& j, const error_report_t& o) {
  j = json_t::object();
  j["error_id"] = o.error_id;
  j["code"] = o.code;
  j["message"] = o.message;
  j["retryable"] = o.retryable;
  encoding::json::write_optional(j, "related_message_id",
                                 o.related_message_id);
  j["timestamp"] = o.timestamp;
  encoding::json::write_optional(j, "details", o.details);
}

void from_json(const json_t& j, error_report_t& o) {
  o = error_report_t{};
  encoding::json::read_or_default(j, "error_id", o.error_id);
  o.code = encoding::json::require_string(j, "code");
  encoding::json::read_or_default(j, "message", o.message);
  encoding::json::read_or_default(j, "retryable", o.retryable);
  encoding::json::read_optional(j, "related_message_id", o.related_message_id);
  encoding::json::read_or_default(j, "timestamp", o.timestamp);
  encoding::json::read_optional(j, "details", o.details);
}

void to_json(json_t& j, const error_message_t& o) {
  j = json_t::object();
  j["error"] = o.error;
}

void from_json(const json_t& j, error_message_t& o) {
  o.error = encoding::json::require(j, "error").get<error_report_t>();
}

template <typename T>
  requires std::same_as<T, message_payload_t>
void to_json(json_t& j, const T& o) {
  std::visit([&](const auto& payload) { to_json(j, payload); }, o);
}

template void to_json<message_payload_t>(json_t& j,
                                         const message_payload_t& o);

std::optional<message_payload_t> try_decode_payload(const message_type_t type,
                                                    const json_t& document,
                                                    std::string& error) {
  try {
    switch (type) {
      case message_type_t::intent_declaration:
        return decode_as<intent_declaration_t>(document);
      case message_type_t::capability_disclosure:
        return decode_as<capability_disclosure_t>(document);
      case message_type_t::contract_proposal:
        return decode_as<contract_proposal_t>(document);
      case message_type_t::contract_counterproposal:
        return decode_as<contract_counterproposal_t>(document);
      case message_type_t::contract_acceptance:
        return decode_as<contract_acceptance_t>(document);
      case message_type_t::contract_rejection:
        return decode_as<contract_rejection_t>(document);
      case message_type_t::execution_token:
        return decode_as<execution_token_message_t>(document);
      case message_type_t::execution_request:
        return decode_as<execution_request_message_t>(document);
      case message_type_t::execution_result:
        return decode_as<execution_result_message_t>(document);
      case message_type_t::audit_event:
        return decode_as<audit_event_message_t>(document);
      case message_type_t::error:
        return decode_as<error_message_t>(document);
    }
  } catch (const std::exception& e) {
    error = e.what();
    return std::nullopt;
  }
  error = "unknown message type";
  return std::nullopt;
}

}  // namespace icnp::schema
