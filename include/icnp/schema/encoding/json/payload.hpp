#pragma once

#include <icnp/schema/message_type.hpp>
#include <icnp/schema/payload.hpp>
#include <icnp/schema/primitives.hpp>

#include <concepts>
#include <optional>
#include <string>

namespace icnp::schema {

void to_json(json_t& j, const acceptance_decision_t& o);
void from_json(const json_t& j, acceptance_decision_t& o);

// Wire form `{intent{...}, constraints{...}}`. Constraints nested inside the
// intent object are read when the top-level member is absent.
void to_json(json_t& j, const intent_declaration_t& o);
void from_json(const json_t& j, intent_declaration_t& o);

void to_json(json_t& j, const capability_disclosure_t& o);
void from_json(const json_t& j, capability_disclosure_t& o);

void to_json(json_t& j, const contract_proposal_t& o);
void from_json(const json_t& j, contract_proposal_t& o);

void to_json(json_t& j, const contract_counterproposal_t& o);
void from_json(const json_t& j, contract_counterproposal_t& o);

void to_json(json_t& j, const contract_acceptance_t& o);
void from_json(const json_t& j, contract_acceptance_t& o);

void to_json(json_t& j, const contract_rejection_t& o);
void from_json(const json_t& j, contract_rejection_t& o);

void to_json(json_t& j, const execution_token_message_t& o);
void from_json(const json_t& j, execution_token_message_t& o);

void to_json(json_t& j, const execution_request_message_t& o);
void from_json(const json_t& j, execution_request_message_t& o);

void to_json(json_t& j, const execution_result_message_t& o);
void from_json(const json_t& j, execution_result_message_t& o);

void to_json(json_t& j, const audit_event_message_t& o);
void from_json(const json_t& j, audit_event_message_t& o);

void to_json(json_t& j, const error_report_t& o);
void from_json(const json_t& j, error_report_t& o);

void to_json(json_t& j, const error_message_t& o);
void from_json(const json_t& j, error_message_t& o);

// Constrained to the exact variant type: as a plain overload it is viable for
// every alternative's members, and nlohmann's converting constructor then
// recurses through the variant's converting constructor.
template <typename T>
  requires std::same_as<T, message_payload_t>
void to_json(json_t& j, const T& o);

/// Decodes `document` as the payload carried by a `type` message.
std::optional<message_payload_t> try_decode_payload(message_type_t type,
                                                    const json_t& document,
                                                    std::string& error);

}  // namespace icnp::schema
