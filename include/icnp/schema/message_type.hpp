#pragma once

#include <icnp/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace icnp::schema {

enum class message_type_t : uint8_t {
  intent_declaration = 0,
  capability_disclosure = 1,
  contract_proposal = 2,
  contract_counterproposal = 3,
  contract_acceptance = 4,
  contract_rejection = 5,
  execution_token = 6,
  execution_request = 7,
  execution_result = 8,
  audit_event = 9,
  error = 10
};

/// Envelope `phase` field. Wider than the session phase: audit and error
/// messages travel outside the negotiation sequence.
enum class message_phase_t : uint8_t {
  intent = 0,
  capability = 1,
  contract = 2,
  token = 3,
  execution = 4,
  audit = 5,
  error = 6
};

inline constexpr auto kMessageTypeMappings = std::array{
    enum_mapping_t<message_type_t>{"intent_declaration",
                                   message_type_t::intent_declaration},
    enum_mapping_t<message_type_t>{"capability_disclosure",
                                   message_type_t::capability_disclosure},
    enum_mapping_t<message_type_t>{"contract_proposal",
                                   message_type_t::contract_proposal},
    enum_mapping_t<message_type_t>{"contract_counterproposal",
                                   message_type_t::contract_counterproposal},
    enum_mapping_t<message_type_t>{"contract_acceptance",
                                   message_type_t::contract_acceptance},
    enum_mapping_t<message_type_t>{"contract_rejection",
                                   message_type_t::contract_rejection},
    enum_mapping_t<message_type_t>{"execution_token",
                                   message_type_t::execution_token},
    enum_mapping_t<message_type_t>{"execution_request",
                                   message_type_t::execution_request},
    enum_mapping_t<message_type_t>{"execution_result",
                                   message_type_t::execution_result},
    enum_mapping_t<message_type_t>{"audit_event", message_type_t::audit_event},
    enum_mapping_t<message_type_t>{"error", message_type_t::error}};

inline constexpr auto kMessagePhaseMappings = std::array{
    enum_mapping_t<message_phase_t>{"intent", message_phase_t::intent},
    enum_mapping_t<message_phase_t>{"capability", message_phase_t::capability},
    enum_mapping_t<message_phase_t>{"contract", message_phase_t::contract},
    enum_mapping_t<message_phase_t>{"token", message_phase_t::token},
    enum_mapping_t<message_phase_t>{"execution", message_phase_t::execution},
    enum_mapping_t<message_phase_t>{"audit", message_phase_t::audit},
    enum_mapping_t<message_phase_t>{"error", message_phase_t::error}};

template <>
inline std::optional<message_type_t> try_from_string<message_type_t>(
    const std::string_view value) {
  return from_string(value, kMessageTypeMappings);
}

template <>
inline std::optional<message_phase_t> try_from_string<message_phase_t>(
    const std::string_view value) {
  return from_string(value, kMessagePhaseMappings);
}

inline constexpr std::string_view to_string(const message_type_t value) {
  return to_string(value, kMessageTypeMappings).value_or("unknown");
}

inline constexpr std::string_view to_string(const message_phase_t value) {
  return to_string(value, kMessagePhaseMappings).value_or("unknown");
}

inline constexpr message_phase_t expected_phase(const message_type_t type) {
  switch (type) {
    case message_type_t::intent_declaration:
      return message_phase_t::intent;
    case message_type_t::capability_disclosure:
      return message_phase_t::capability;
    case message_type_t::contract_proposal:
    case message_type_t::contract_counterproposal:
    case message_type_t::contract_acceptance:
    case message_type_t::contract_rejection:
      return message_phase_t::contract;
    case message_type_t::execution_token:
      return message_phase_t::token;
    case message_type_t::execution_request:
    case message_type_t::execution_result:
      return message_phase_t::execution;
    case message_type_t::audit_event:
      return message_phase_t::audit;
    case message_type_t::error:
    default:
      return message_phase_t::error;
  }
}

}  // namespace icnp::schema
