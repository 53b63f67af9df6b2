#pragma once

#include <icnp/schema/enum_string.hpp>
#include <icnp/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace icnp::schema {

enum class audit_event_kind_t : uint8_t {
  session_created = 0,
  phase_changed = 1,
  intent_recorded = 2,
  capability_disclosed = 3,
  contract_proposed = 4,
  contract_counterproposed = 5,
  contract_signed = 6,
  contract_accepted = 7,
  contract_rejected = 8,
  token_issued = 9,
  token_accepted = 10,
  token_revoked = 11,
  execution_started = 12,
  execution_completed = 13,
  execution_failed = 14,
  violation = 15,
  rollback = 16,
  session_expired = 17,
  session_aborted = 18,
  session_completed = 19,
  message_rejected = 20,
  peer_audit = 21,
  peer_error = 22
};

enum class audit_severity_t : uint8_t {
  info = 0,
  warning = 1,
  error = 2,
  critical = 3
};

inline constexpr auto kAuditEventKindMappings = std::array{
    enum_mapping_t<audit_event_kind_t>{"session_created",
                                       audit_event_kind_t::session_created},
    enum_mapping_t<audit_event_kind_t>{"phase_changed",
                                       audit_event_kind_t::phase_changed},
    enum_mapping_t<audit_event_kind_t>{"intent_recorded",
                                       audit_event_kind_t::intent_recorded},
    enum_mapping_t<audit_event_kind_t>{
        "capability_disclosed", audit_event_kind_t::capability_disclosed},
    enum_mapping_t<audit_event_kind_t>{"contract_proposed",
                                       audit_event_kind_t::contract_proposed},
    enum_mapping_t<audit_event_kind_t>{
        "contract_counterproposed",
        audit_event_kind_t::contract_counterproposed},
    enum_mapping_t<audit_event_kind_t>{"contract_signed",
                                       audit_event_kind_t::contract_signed},
    enum_mapping_t<audit_event_kind_t>{"contract_accepted",
                                       audit_event_kind_t::contract_accepted},
    enum_mapping_t<audit_event_kind_t>{"contract_rejected",
                                       audit_event_kind_t::contract_rejected},
    enum_mapping_t<audit_event_kind_t>{"token_issued",
                                       audit_event_kind_t::token_issued},
    enum_mapping_t<audit_event_kind_t>{"token_accepted",
                                       audit_event_kind_t::token_accepted},
    enum_mapping_t<audit_event_kind_t>{"token_revoked",
                                       audit_event_kind_t::token_revoked},
    enum_mapping_t<audit_event_kind_t>{"execution_started",
                                       audit_event_kind_t::execution_started},
    enum_mapping_t<audit_event_kind_t>{
        "execution_completed", audit_event_kind_t::execution_completed},
    enum_mapping_t<audit_event_kind_t>{"execution_failed",
                                       audit_event_kind_t::execution_failed},
    enum_mapping_t<audit_event_kind_t>{"violation",
                                       audit_event_kind_t::violation},
    enum_mapping_t<audit_event_kind_t>{"rollback", audit_event_kind_t::rollback},
    enum_mapping_t<audit_event_kind_t>{"session_expired",
                                       audit_event_kind_t::session_expired},
    enum_mapping_t<audit_event_kind_t>{"session_aborted",
                                       audit_event_kind_t::session_aborted},
    enum_mapping_t<audit_event_kind_t>{"session_completed",
                                       audit_event_kind_t::session_completed},
    enum_mapping_t<audit_event_kind_t>{"message_rejected",
                                       audit_event_kind_t::message_rejected},
    enum_mapping_t<audit_event_kind_t>{"peer_audit",
                                       audit_event_kind_t::peer_audit},
    enum_mapping_t<audit_event_kind_t>{"peer_error",
                                       audit_event_kind_t::peer_error}};

inline constexpr auto kAuditSeverityMappings = std::array{
    enum_mapping_t<audit_severity_t>{"info", audit_severity_t::info},
    enum_mapping_t<audit_severity_t>{"warning", audit_severity_t::warning},
    enum_mapping_t<audit_severity_t>{"error", audit_severity_t::error},
    enum_mapping_t<audit_severity_t>{"critical", audit_severity_t::critical}};

template <>
inline std::optional<audit_event_kind_t> try_from_string<audit_event_kind_t>(
    const std::string_view value) {
  return from_string(value, kAuditEventKindMappings);
}

template <>
inline std::optional<audit_severity_t> try_from_string<audit_severity_t>(
    const std::string_view value) {
  return from_string(value, kAuditSeverityMappings);
}

inline constexpr std::string_view to_string(const audit_event_kind_t value) {
  return to_string(value, kAuditEventKindMappings).value_or("unknown");
}

inline constexpr std::string_view to_string(const audit_severity_t value) {
  return to_string(value, kAuditSeverityMappings).value_or("unknown");
}

template <uint16_t Version>
struct audit_event;

template <>
struct audit_event<1> final {
  uint16_t version{1};
  // Assigned by the audit log on append; zero until then.
  uint64_t sequence{};
  audit_event_kind_t kind{audit_event_kind_t::session_created};
  std::string session_id;
  std::vector<std::string> subject_ids;
  timestamp_milliseconds_t timestamp{};
  audit_severity_t severity{audit_severity_t::info};
  json_t details = json_t::object();
};

using audit_event_t = audit_event<1>;

}  // namespace icnp::schema
