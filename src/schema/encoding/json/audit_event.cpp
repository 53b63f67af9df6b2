#include <icnp/common/time.hpp>
#include <icnp/schema/encoding/json/audit_event.hpp>
#include <icnp/schema/encoding/json/primitives.hpp>

namespace icnp::schema {

void to_json(json_t& j, const audit_event_kind_t& o) {
  j = std::string{to_string(o)};
}

void from_json(const json_t& j, audit_event_kind_t& o) {
  o = encoding::json::enum_from_json<audit_event_kind_t>(j);
}

void to_json(json_t& j, const audit_severity_t& o) {
  j = std::string{to_string(o)};
}

void from_json(const json_t& j, audit_severity_t& o) {
  o = encoding::json::enum_from_json<audit_severity_t>(j);
}

void to_json(json_t& j, const audit_event<1>& o) {
  j = json_t::object();
  j["sequence"] = o.sequence;
  j["kind"] = o.kind;
  j["session_id"] = o.session_id;
  j["subject_ids"] = o.subject_ids;
  j["timestamp"] = common::format_rfc3339(o.timestamp);
  j["severity"] = o.severity;
  j["details"] = o.details;
}

void from_json(const json_t& j, audit_event<1>& o) {
  o = audit_event<1>{};
  const auto& sequence = encoding::json::require(j, "sequence");
  if (!sequence.is_number_unsigned()) {
    throw std::invalid_argument("field 'sequence' must be unsigned");
  }
  o.sequence = sequence.get<uint64_t>();
  o.kind = encoding::json::require(j, "kind").get<audit_event_kind_t>();
  o.session_id = encoding::json::require_string(j, "session_id");
  encoding::json::read_or_default(j, "subject_ids", o.subject_ids);
  const auto timestamp =
      common::parse_rfc3339(encoding::json::require_string(j, "timestamp"));
  if (!timestamp) {
    throw std::invalid_argument("field 'timestamp' is not RFC3339");
  }
  o.timestamp = *timestamp;
  encoding::json::read_or_default(j, "severity", o.severity);
  encoding::json::read_or_default(j, "details", o.details);
}

}  // namespace icnp::schema
