#include <icnp/audit/audit_log.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

#include <spdlog/spdlog.h>

namespace icnp::audit {

audit_log::audit_log(icnp::execution::audit_sink_t sink)
    : sink_(std::move(sink)) {}

uint64_t audit_log::append(icnp::schema::audit_event_t event) {
  auto lock = std::scoped_lock{mutex_};
  event.sequence = next_sequence_.fetch_add(1);
  spdlog::debug("audit #{} {} session={}", event.sequence,
                icnp::schema::to_string(event.kind), event.session_id);
  if (sink_ && !sink_(event)) {
    sink_failures_.fetch_add(1);
    spdlog::error("Durable audit sink refused event #{} ({})", event.sequence,
                  icnp::schema::to_string(event.kind));
  }
  const auto sequence = event.sequence;
  events_.push_back(std::move(event));
  return sequence;
}

std::vector<icnp::schema::audit_event_t> audit_log::events() const {
  auto lock = std::scoped_lock{mutex_};
  return events_;
}

std::vector<icnp::schema::audit_event_t> audit_log::events_for(
    const std::string_view session_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto result = std::vector<icnp::schema::audit_event_t>{};
  std::copy_if(std::begin(events_), std::end(events_),
               std::back_inserter(result),
               [&](const icnp::schema::audit_event_t& event) {
                 return event.session_id == session_id;
               });
  return result;
}

std::size_t audit_log::size() const {
  auto lock = std::scoped_lock{mutex_};
  return events_.size();
}

uint64_t audit_log::sink_failures() const {
  return sink_failures_.load();
}

icnp::schema::audit_event_t make_audit_event(
    const icnp::schema::audit_event_kind_t kind,
    std::string session_id,
    std::vector<std::string> subject_ids,
    const icnp::schema::timestamp_milliseconds_t timestamp,
    icnp::schema::json_t details,
    const icnp::schema::audit_severity_t severity) {
  auto event = icnp::schema::audit_event_t{};
  event.kind = kind;
  event.session_id = std::move(session_id);
  event.subject_ids = std::move(subject_ids);
  event.timestamp = timestamp;
  event.severity = severity;
  event.details = std::move(details);
  return event;
}

}  // namespace icnp::audit
