#pragma once

#include <icnp/schema/session_phase.hpp>

#include <array>
#include <cstddef>

namespace icnp::session {

inline constexpr auto kPhaseCount = std::size_t{8};

using transition_row_t = std::array<bool, kPhaseCount>;

// Rows are the current phase, columns the target, both in session_phase_t
// order: intent, capability, contract, token, execution, completed, aborted,
// expired.
inline constexpr auto kTransitionTable = std::array<transition_row_t, kPhaseCount>{
    transition_row_t{false, true, false, false, false, false, true, true},
    transition_row_t{false, false, true, false, false, false, true, true},
    transition_row_t{false, false, false, true, false, false, true, true},
    transition_row_t{false, false, false, false, true, false, true, true},
    transition_row_t{false, false, false, false, false, true, true, true},
    transition_row_t{false, false, false, false, false, false, false, false},
    transition_row_t{false, false, false, false, false, false, false, false},
    transition_row_t{false, false, false, false, false, false, false, false}};

inline constexpr bool can_transition(const icnp::schema::session_phase_t from,
                                     const icnp::schema::session_phase_t to) {
  const auto row = static_cast<std::size_t>(from);
  const auto column = static_cast<std::size_t>(to);
  if (row >= kPhaseCount || column >= kPhaseCount) {
    return false;
  }
  return kTransitionTable[row][column];
}

static_assert(can_transition(icnp::schema::session_phase_t::intent,
                             icnp::schema::session_phase_t::capability));
static_assert(can_transition(icnp::schema::session_phase_t::execution,
                             icnp::schema::session_phase_t::completed));
static_assert(!can_transition(icnp::schema::session_phase_t::intent,
                              icnp::schema::session_phase_t::contract));
static_assert(!can_transition(icnp::schema::session_phase_t::completed,
                              icnp::schema::session_phase_t::aborted));
static_assert(!can_transition(icnp::schema::session_phase_t::token,
                              icnp::schema::session_phase_t::token));

}  // namespace icnp::session
