#include <icnp/session/phase_machine.hpp>
#include <icnp/session/session_store.hpp>

#include <algorithm>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

using namespace icnp::schema;

namespace icnp::session {

session_lease::session_lease(std::shared_ptr<session_slot_t> slot,
                             std::unique_lock<std::mutex> lock)
    : slot_(std::move(slot)), lock_(std::move(lock)) {}

session_store::session_store(icnp::audit::audit_log& audit) : audit_(audit) {}

std::optional<session_lease> session_store::acquire(
    const std::string_view session_id) {
  auto slot = std::shared_ptr<session_slot_t>{};
  {
    auto lock = std::shared_lock{mutex_};
    const auto it = sessions_.find(std::string{session_id});
    if (it == sessions_.end()) {
      return std::nullopt;
    }
    slot = it->second;
  }
  auto session_lock = std::unique_lock{slot->mutex};
  return session_lease{std::move(slot), std::move(session_lock)};
}

session_lease session_store::open(const std::string& session_id,
                                  const actor_t& initiator,
                                  const timestamp_milliseconds_t now,
                                  const duration_milliseconds_t negotiation_ttl,
                                  bool& created) {
  auto slot = std::shared_ptr<session_slot_t>{};
  created = false;
  {
    auto lock = std::unique_lock{mutex_};
    auto& entry = sessions_[session_id];
    if (!entry) {
      entry = std::make_shared<session_slot_t>();
      entry->session.id = session_id;
      entry->session.phase = session_phase_t::intent;
      entry->session.initiator = initiator;
      entry->session.participants.emplace(initiator.id, initiator);
      entry->session.created_at = now;
      entry->session.negotiation_deadline = now + negotiation_ttl;
      created = true;
    }
    slot = entry;
  }

  auto session_lock = std::unique_lock{slot->mutex};
  if (created) {
    spdlog::info("Session {} created by {}", session_id, initiator.id);
    audit_.append(icnp::audit::make_audit_event(
        audit_event_kind_t::session_created, session_id, {initiator.id}, now,
        json_t{{"initiator", initiator.id},
               {"negotiation_deadline", slot->session.negotiation_deadline}}));
  }
  return session_lease{std::move(slot), std::move(session_lock)};
}

operation_result_t session_store::transition(session_t& session,
                                             const session_phase_t target,
                                             const timestamp_milliseconds_t now) {
  const auto from = session.phase;
  if (!can_transition(from, target)) {
    spdlog::warn("Session {}: illegal transition {} -> {}", session.id,
                 to_string(from), to_string(target));
    return make_failure(
        negotiation_error_code::illegal_phase_transition,
        error_class_t::constraints_unsatisfiable, "illegal phase transition",
        fmt::format("{} -> {}", to_string(from), to_string(target)),
        "icnp.session");
  }

  session.phase = target;
  spdlog::info("Session {}: {} -> {}", session.id, to_string(from),
               to_string(target));
  audit_.append(icnp::audit::make_audit_event(
      audit_event_kind_t::phase_changed, session.id, {}, now,
      json_t{{"from", std::string{to_string(from)}},
             {"to", std::string{to_string(target)}}}));

  auto terminal_kind = std::optional<audit_event_kind_t>{};
  switch (target) {
    case session_phase_t::completed:
      terminal_kind = audit_event_kind_t::session_completed;
      break;
    case session_phase_t::aborted:
      terminal_kind = audit_event_kind_t::session_aborted;
      break;
    case session_phase_t::expired:
      terminal_kind = audit_event_kind_t::session_expired;
      break;
    default:
      break;
  }
  if (terminal_kind) {
    audit_.append(icnp::audit::make_audit_event(
        *terminal_kind, session.id, {}, now,
        json_t{{"phase_before", std::string{to_string(from)}}},
        target == session_phase_t::completed ? audit_severity_t::info
                                             : audit_severity_t::warning));
  }
  return make_success(std::string{to_string(target)});
}

bool session_store::expire_if_due(session_t& session,
                                  const timestamp_milliseconds_t now) {
  if (session.phase == session_phase_t::expired) {
    return true;
  }
  if (!is_negotiating(session.phase) || now < session.negotiation_deadline) {
    return false;
  }
  spdlog::info("Session {} expired in phase {}", session.id,
               to_string(session.phase));
  return transition(session, session_phase_t::expired, now).ok();
}

std::size_t session_store::size() const {
  auto lock = std::shared_lock{mutex_};
  return sessions_.size();
}

std::vector<std::string> session_store::session_ids() const {
  auto lock = std::shared_lock{mutex_};
  auto result = std::vector<std::string>{};
  result.reserve(sessions_.size());
  for (const auto& [id, slot] : sessions_) {
    result.push_back(id);
  }
  std::sort(std::begin(result), std::end(result));
  return result;
}

}  // namespace icnp::session
