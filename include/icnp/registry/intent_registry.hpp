#pragma once

#include <icnp/audit/audit_log.hpp>
#include <icnp/schema/actor.hpp>
#include <icnp/schema/intent.hpp>
#include <icnp/schema/operation_result.hpp>
#include <icnp/schema/primitives.hpp>
#include <icnp/session/session.hpp>

#include <optional>

namespace icnp::registry {

/// Holds the one intent of each session. Recorded once, never replaced.
class intent_registry final {
 public:
  explicit intent_registry(icnp::audit::audit_log& audit);

  /// Record the initiator's intent. `document` is the declaration payload as
  /// received; when absent it is re-encoded from `intent`.
  icnp::schema::operation_result_t record_intent(
      icnp::session::session_t& session,
      const icnp::schema::actor_t& declarer,
      const icnp::schema::intent_t& intent,
      std::optional<icnp::schema::json_t> document,
      icnp::schema::timestamp_milliseconds_t now);

  /// Content rules only: goal and requested actions present, and a zero risk
  /// tolerance paired with mandatory human approval.
  static icnp::schema::operation_result_t validate(
      const icnp::schema::intent_t& intent);

 private:
  icnp::audit::audit_log& audit_;
};

}  // namespace icnp::registry
