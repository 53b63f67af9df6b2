#pragma once

#include <icnp/audit/audit_log.hpp>
#include <icnp/schema/actor.hpp>
#include <icnp/schema/operation_result.hpp>
#include <icnp/schema/primitives.hpp>
#include <icnp/schema/session_phase.hpp>
#include <icnp/session/session.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace icnp::session {

/// Exclusive access to one session for as long as the lease lives.
class session_lease final {
 public:
  session_lease(std::shared_ptr<session_slot_t> slot,
                std::unique_lock<std::mutex> lock);

  session_t& operator*() const { return slot_->session; }
  session_t* operator->() const { return &slot_->session; }

 private:
  std::shared_ptr<session_slot_t> slot_;
  std::unique_lock<std::mutex> lock_;
};

/// Arena of sessions keyed by session id, one lock per session.
///
/// The arena lock only guards the map itself; every read or write of a
/// session's state happens under that session's own lock, held through a
/// `session_lease`. Sessions are never removed: terminal sessions stay
/// readable and reject further messages.
class session_store final {
 public:
  explicit session_store(icnp::audit::audit_log& audit);

  /// Lease an existing session.
  std::optional<session_lease> acquire(std::string_view session_id);

  /// Lease the session, creating it in the intent phase when absent.
  /// `created` reports whether this call created it.
  session_lease open(const std::string& session_id,
                     const icnp::schema::actor_t& initiator,
                     icnp::schema::timestamp_milliseconds_t now,
                     icnp::schema::duration_milliseconds_t negotiation_ttl,
                     bool& created);

  /// Apply a transition from the phase table and audit it. Illegal
  /// transitions are reported and leave the session unchanged.
  icnp::schema::operation_result_t transition(
      session_t& session,
      icnp::schema::session_phase_t target,
      icnp::schema::timestamp_milliseconds_t now);

  /// Lazy expiry: a session still negotiating past its deadline moves to
  /// `expired`. Returns true when the session is expired after the call.
  bool expire_if_due(session_t& session,
                     icnp::schema::timestamp_milliseconds_t now);

  std::size_t size() const;
  std::vector<std::string> session_ids() const;

 private:
  icnp::audit::audit_log& audit_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<session_slot_t>> sessions_;
};

}  // namespace icnp::session
