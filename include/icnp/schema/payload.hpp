#pragma once

#include <icnp/schema/capability.hpp>
#include <icnp/schema/contract.hpp>
#include <icnp/schema/enum_string.hpp>
#include <icnp/schema/execution.hpp>
#include <icnp/schema/execution_token.hpp>
#include <icnp/schema/intent.hpp>
#include <icnp/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Typed payloads, one per message type.
namespace icnp::schema {

enum class acceptance_decision_t : uint8_t { accept = 0, reject = 1 };

inline constexpr auto kAcceptanceDecisionMappings = std::array{
    enum_mapping_t<acceptance_decision_t>{"accept",
                                          acceptance_decision_t::accept},
    enum_mapping_t<acceptance_decision_t>{"reject",
                                          acceptance_decision_t::reject}};

template <>
inline std::optional<acceptance_decision_t>
try_from_string<acceptance_decision_t>(const std::string_view value) {
  return from_string(value, kAcceptanceDecisionMappings);
}

inline constexpr std::string_view to_string(const acceptance_decision_t value) {
  return to_string(value, kAcceptanceDecisionMappings).value_or("unknown");
}

struct intent_declaration_t final {
  intent_t intent;
};

struct capability_disclosure_t final {
  std::vector<capability_t> capabilities;
};

struct contract_proposal_t final {
  contract_t contract;
};

struct contract_counterproposal_t final {
  contract_t contract;
  std::optional<std::string> reason;
};

/// Either `contract_id` or a full `contract` identifies what is being
/// accepted; the embedded contract is only used for its id.
struct contract_acceptance_t final {
  std::optional<std::string> contract_id;
  std::optional<contract_t> contract;
  acceptance_decision_t decision{acceptance_decision_t::accept};
  std::optional<signature_t> signature;
  std::optional<std::string> reason;
};

struct contract_rejection_t final {
  std::string contract_id;
  std::optional<std::string> reason;
};

struct execution_token_message_t final {
  execution_token_t token;
};

struct execution_request_message_t final {
  execution_request_t request;
};

struct execution_result_message_t final {
  execution_result_t result;
};

/// Peer-produced audit record. Kept opaque.
struct audit_event_message_t final {
  json_t event = json_t::object();
};

struct error_report_t final {
  std::string error_id;
  // ICNP-001 .. ICNP-006
  std::string code;
  std::string message;
  bool retryable{};
  std::optional<std::string> related_message_id;
  std::string timestamp;
  std::optional<json_t> details;
};

struct error_message_t final {
  error_report_t error;
};

using message_payload_t = std::variant<intent_declaration_t,
                                       capability_disclosure_t,
                                       contract_proposal_t,
                                       contract_counterproposal_t,
                                       contract_acceptance_t,
                                       contract_rejection_t,
                                       execution_token_message_t,
                                       execution_request_message_t,
                                       execution_result_message_t,
                                       audit_event_message_t,
                                       error_message_t>;

}  // namespace icnp::schema
