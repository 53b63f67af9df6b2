#pragma once

#include <icnp/execution/collaborators.hpp>
#include <icnp/schema/audit_event.hpp>
#include <icnp/schema/primitives.hpp>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace icnp::audit {

/// Grow-only, globally sequenced record of protocol and execution facts.
///
/// Sequence numbers start at 1 and are assigned from a single atomic counter
/// shared by every session. Each appended event is forwarded to the durable
/// sink (when one is configured) in sequence order; a sink refusal is logged
/// and counted but never rolls back the in-memory record.
class audit_log final {
 public:
  explicit audit_log(icnp::execution::audit_sink_t sink = {});

  audit_log(const audit_log&) = delete;
  audit_log& operator=(const audit_log&) = delete;

  /// Append `event` and return the sequence it was given.
  uint64_t append(icnp::schema::audit_event_t event);

  std::vector<icnp::schema::audit_event_t> events() const;
  std::vector<icnp::schema::audit_event_t> events_for(
      std::string_view session_id) const;
  std::size_t size() const;

  /// Events the durable sink refused.
  uint64_t sink_failures() const;

 private:
  mutable std::mutex mutex_;
  std::atomic<uint64_t> next_sequence_{1};
  std::atomic<uint64_t> sink_failures_{0};
  std::vector<icnp::schema::audit_event_t> events_;
  icnp::execution::audit_sink_t sink_;
};

icnp::schema::audit_event_t make_audit_event(
    icnp::schema::audit_event_kind_t kind,
    std::string session_id,
    std::vector<std::string> subject_ids,
    icnp::schema::timestamp_milliseconds_t timestamp,
    icnp::schema::json_t details = icnp::schema::json_t::object(),
    icnp::schema::audit_severity_t severity =
        icnp::schema::audit_severity_t::info);

}  // namespace icnp::audit
