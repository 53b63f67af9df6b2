#pragma once

#include <icnp/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace icnp::schema {

/// Protocol error taxonomy. Numeric values match the `ICNP-00x` wire codes.
enum class error_class_t : uint8_t {
  none = 0,
  invalid_intent = 1,
  capability_mismatch = 2,
  constraints_unsatisfiable = 3,
  unauthorised_action = 4,
  token_invalid = 5,
  internal_error = 6
};

inline constexpr auto kErrorClassMappings = std::array{
    enum_mapping_t<error_class_t>{"none", error_class_t::none},
    enum_mapping_t<error_class_t>{"invalid_intent",
                                  error_class_t::invalid_intent},
    enum_mapping_t<error_class_t>{"capability_mismatch",
                                  error_class_t::capability_mismatch},
    enum_mapping_t<error_class_t>{"constraints_unsatisfiable",
                                  error_class_t::constraints_unsatisfiable},
    enum_mapping_t<error_class_t>{"unauthorised_action",
                                  error_class_t::unauthorised_action},
    enum_mapping_t<error_class_t>{"token_invalid", error_class_t::token_invalid},
    enum_mapping_t<error_class_t>{"internal_error",
                                  error_class_t::internal_error}};

inline constexpr auto kProtocolCodeMappings = std::array{
    enum_mapping_t<error_class_t>{"ICNP-001", error_class_t::invalid_intent},
    enum_mapping_t<error_class_t>{"ICNP-002",
                                  error_class_t::capability_mismatch},
    enum_mapping_t<error_class_t>{"ICNP-003",
                                  error_class_t::constraints_unsatisfiable},
    enum_mapping_t<error_class_t>{"ICNP-004",
                                  error_class_t::unauthorised_action},
    enum_mapping_t<error_class_t>{"ICNP-005", error_class_t::token_invalid},
    enum_mapping_t<error_class_t>{"ICNP-006", error_class_t::internal_error}};

template <>
inline std::optional<error_class_t> try_from_string<error_class_t>(
    const std::string_view value) {
  return from_string(value, kErrorClassMappings);
}

inline constexpr std::string_view to_string(const error_class_t value) {
  return to_string(value, kErrorClassMappings).value_or("unknown");
}

inline constexpr std::string_view to_protocol_code(const error_class_t value) {
  return to_string(value, kProtocolCodeMappings).value_or("ICNP-006");
}

inline constexpr std::optional<error_class_t> from_protocol_code(
    const std::string_view value) {
  return from_string(value, kProtocolCodeMappings);
}

/// Precise rejection reasons reported alongside the error class.
enum class negotiation_error_code : uint32_t {
  malformed_envelope = 1,
  unsupported_version = 2,
  invalid_message_id = 3,
  invalid_session_id = 4,
  invalid_timestamp = 5,
  unknown_message_type = 6,
  phase_type_mismatch = 7,
  unresolved_reply = 8,
  malformed_payload = 9,
  session_missing = 10,
  session_terminal = 11,
  session_expired = 12,
  illegal_phase_transition = 13,
  invalid_actor = 14,

  intent_missing_goal = 20,
  intent_missing_actions = 21,
  intent_risk_requires_approval = 22,
  intent_already_recorded = 23,
  intent_not_recorded = 24,

  capability_disclosure_closed = 30,
  capability_conflict = 31,
  capability_confidence_out_of_range = 32,
  capability_missing = 33,
  capability_owner_mismatch = 34,
  capability_action_missing = 35,
  capability_scope_missing = 36,
  requested_action_uncovered = 37,
  capability_malformed = 38,

  contract_empty = 40,
  contract_session_mismatch = 41,
  side_effects_forbidden = 42,
  contract_phase_closed = 43,
  contract_missing = 44,
  contract_superseded = 45,
  contract_already_accepted = 46,
  proposer_not_initiator = 47,
  signer_not_party = 48,
  signature_invalid = 49,
  approval_missing = 50,
  approval_rejected = 51,
  contract_not_accepted = 52,
  constraints_loosened = 53,
  contract_id_reused = 54,
  invocation_limit_invalid = 55,

  token_missing = 60,
  token_not_yet_valid = 61,
  token_expired = 62,
  token_revoked = 63,
  token_signature_invalid = 64,
  token_contract_mismatch = 65,
  token_session_mismatch = 66,
  token_binding_mismatch = 67,
  token_already_issued = 68,

  action_forbidden = 70,
  action_not_agreed = 71,
  executor_not_in_audience = 72,
  per_actor_limit_exceeded = 73,
  total_limit_exceeded = 74,
  action_limit_exceeded = 75,
  invocation_replayed = 76,
  nonce_replayed = 77,
  invocation_missing = 78,
  invocation_not_executing = 79,
  session_not_executing = 80,

  collaborator_timeout = 90,
  collaborator_failure = 91,
  canonicalization_failed = 92,
};

}  // namespace icnp::schema
