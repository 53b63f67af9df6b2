#include <icnp/schema/encoding/json/actor.hpp>
#include <icnp/schema/encoding/json/envelope.hpp>
#include <icnp/schema/encoding/json/primitives.hpp>

namespace icnp::schema {

void to_json(json_t& j, const message_type_t& o) {
  j = std::string{to_string(o)};
}

void from_json(const json_t& j, message_type_t& o) {
  o = encoding::json::enum_from_json<message_type_t>(j);
}

void to_json(json_t& j, const message_phase_t& o) {
  j = std::string{to_string(o)};
}

void from_json(const json_t& j, message_phase_t& o) {
  o = encoding::json::enum_from_json<message_phase_t>(j);
}

void to_json(json_t& j, const envelope<1>& o) {
  j = json_t::object();
  j["icnp_version"] = o.icnp_version;
  j["type"] = o.type;
  j["phase"] = o.phase;
  j["message_id"] = o.message_id;
  j["session_id"] = o.session_id;
  j["timestamp"] = o.timestamp;
  j["sender"] = o.sender;
  encoding::json::write_optional(j, "recipient", o.recipient);
  encoding::json::write_optional(j, "in_reply_to", o.in_reply_to);
  encoding::json::write_optional(j, "trace", o.trace);
  j["payload"] = o.payload;
  encoding::json::write_optional(j, "extensions", o.extensions);
}

void from_json(const json_t& j, envelope<1>& o) {
  o = envelope<1>{};
  o.icnp_version = encoding::json::require_string(j, "icnp_version");
  o.type = encoding::json::require(j, "type").get<message_type_t>();
  o.phase = encoding::json::require(j, "phase").get<message_phase_t>();
  o.message_id = encoding::json::require_string(j, "message_id");
  o.session_id = encoding::json::require_string(j, "session_id");
  o.timestamp = encoding::json::require_string(j, "timestamp");
  o.sender = encoding::json::require(j, "sender").get<actor_t>();
  encoding::json::read_optional(j, "recipient", o.recipient);
  encoding::json::read_optional(j, "in_reply_to", o.in_reply_to);
  encoding::json::read_optional(j, "trace", o.trace);
  o.payload = encoding::json::require(j, "payload");
  if (!o.payload.is_object()) {
    throw std::invalid_argument("field 'payload' must be an object");
  }
  encoding::json::read_optional(j, "extensions", o.extensions);
}

}  // namespace icnp::schema
