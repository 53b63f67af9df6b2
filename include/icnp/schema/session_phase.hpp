#pragma once

#include <icnp/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: session phase.
// Negotiation lifecycle: four handshake phases, governed execution, and the
// three terminal outcomes.
namespace icnp::schema {

enum class session_phase_t : uint8_t {
  intent = 0,
  capability = 1,
  contract = 2,
  token = 3,
  execution = 4,
  completed = 5,
  aborted = 6,
  expired = 7
};

inline constexpr auto kSessionPhaseMappings = std::array{
    enum_mapping_t<session_phase_t>{"intent", session_phase_t::intent},
    enum_mapping_t<session_phase_t>{"capability", session_phase_t::capability},
    enum_mapping_t<session_phase_t>{"contract", session_phase_t::contract},
    enum_mapping_t<session_phase_t>{"token", session_phase_t::token},
    enum_mapping_t<session_phase_t>{"execution", session_phase_t::execution},
    enum_mapping_t<session_phase_t>{"completed", session_phase_t::completed},
    enum_mapping_t<session_phase_t>{"aborted", session_phase_t::aborted},
    enum_mapping_t<session_phase_t>{"expired", session_phase_t::expired}};

template <>
inline std::optional<session_phase_t> try_from_string<session_phase_t>(
    const std::string_view value) {
  return from_string(value, kSessionPhaseMappings);
}

inline constexpr std::string_view to_string(const session_phase_t value) {
  return to_string(value, kSessionPhaseMappings).value_or("unknown");
}

inline constexpr bool is_terminal(const session_phase_t value) {
  return value == session_phase_t::completed ||
         value == session_phase_t::aborted || value == session_phase_t::expired;
}

/// Phases during which the negotiation time-to-live applies.
inline constexpr bool is_negotiating(const session_phase_t value) {
  return value == session_phase_t::intent ||
         value == session_phase_t::capability ||
         value == session_phase_t::contract;
}

}  // namespace icnp::schema
