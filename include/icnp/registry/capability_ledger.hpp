#pragma once

#include <icnp/audit/audit_log.hpp>
#include <icnp/execution/collaborators.hpp>
#include <icnp/schema/actor.hpp>
#include <icnp/schema/capability.hpp>
#include <icnp/schema/operation_result.hpp>
#include <icnp/schema/primitives.hpp>
#include <icnp/session/session.hpp>
#include <icnp/session/session_store.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace icnp::registry {

struct capability_match_t final {
  std::string participant_id;
  std::string capability_id;
  std::string action;
  double score{};
};

/// Per-session, append-only record of what each participant can do.
class capability_ledger final {
 public:
  capability_ledger(icnp::audit::audit_log& audit,
                    icnp::session::session_store& sessions,
                    icnp::execution::capability_scorer_t scorer);

  /// Append every capability in `capabilities` for `participant`, or none.
  ///
  /// `documents`, when not empty, holds the capability objects as received,
  /// one per capability. An identical re-disclosure is a no-op. The first
  /// disclosure moves the session from intent to capability.
  icnp::schema::operation_result_t disclose(
      icnp::session::session_t& session,
      const icnp::schema::actor_t& participant,
      const std::vector<icnp::schema::capability_t>& capabilities,
      const std::vector<icnp::schema::json_t>& documents,
      icnp::schema::timestamp_milliseconds_t now);

  static const icnp::session::disclosed_capability_t* lookup(
      const icnp::session::session_t& session,
      std::string_view capability_id);

  /// Candidates for `requested_action`, best first. Zero scores are dropped;
  /// ties are ordered by capability id.
  std::vector<capability_match_t> match(
      const icnp::session::session_t& session,
      std::string_view requested_action) const;

 private:
  icnp::audit::audit_log& audit_;
  icnp::session::session_store& sessions_;
  icnp::execution::capability_scorer_t scorer_;
};

}  // namespace icnp::registry
