#include <icnp/common/time.hpp>
#include <icnp/common/uuid.hpp>
#include <icnp/envelope/validator.hpp>
#include <icnp/schema/encoding/json/encoder.hpp>

#include <array>
#include <utility>

#include <spdlog/spdlog.h>

using namespace icnp::schema;

namespace icnp::envelope {

namespace {

constexpr auto kCodespace = std::string_view{"icnp.envelope"};

constexpr auto kRequiredFields =
    std::array<std::string_view, 8>{"icnp_version", "type",      "phase",
                                    "message_id",   "session_id", "timestamp",
                                    "sender",       "payload"};

operation_result_t reject(const negotiation_error_code code,
                          std::string log,
                          std::string info) {
  return make_failure(code, error_class_t::invalid_intent, std::move(log),
                      std::move(info), std::string{kCodespace});
}

bool is_string_member(const json_t& document, const std::string& key) {
  const auto it = document.find(key);
  return it != document.end() && it->is_string();
}

bool valid_actor(const json_t& actor) {
  if (!actor.is_object() || !is_string_member(actor, "id") ||
      !is_string_member(actor, "role")) {
    return false;
  }
  if (actor["id"].get_ref<const std::string&>().empty()) {
    return false;
  }
  return try_from_string<actor_role_t>(
             actor["role"].get_ref<const std::string&>())
      .has_value();
}

}  // namespace

validator::validator(std::string supported_major)
    : supported_major_(std::move(supported_major)) {}

operation_result_t validator::decode(const std::string_view raw,
                                     envelope_t& out,
                                     json_t& document) const {
  document = json_t::parse(raw, nullptr, false);
  if (document.is_discarded()) {
    return reject(negotiation_error_code::malformed_envelope,
                  "envelope is not valid JSON", "");
  }
  return decode(document, out);
}

operation_result_t validator::decode(const json_t& document,
                                     envelope_t& out) const {
  if (!document.is_object()) {
    return reject(negotiation_error_code::malformed_envelope,
                  "envelope must be a JSON object", "");
  }
  for (const auto field : kRequiredFields) {
    const auto it = document.find(std::string{field});
    if (it == document.end() || it->is_null()) {
      return reject(negotiation_error_code::malformed_envelope,
                    "missing envelope field", std::string{field});
    }
  }

  if (!is_string_member(document, "icnp_version")) {
    return reject(negotiation_error_code::unsupported_version,
                  "icnp_version must be a string", "");
  }
  const auto& version = document["icnp_version"].get_ref<const std::string&>();
  const auto major = version.substr(0, version.find('.'));
  if (major != supported_major_) {
    return reject(negotiation_error_code::unsupported_version,
                  "unsupported protocol version", version);
  }

  if (!is_string_member(document, "type")) {
    return reject(negotiation_error_code::unknown_message_type,
                  "type must be a string", "");
  }
  const auto type = try_from_string<message_type_t>(
      document["type"].get_ref<const std::string&>());
  if (!type) {
    return reject(negotiation_error_code::unknown_message_type,
                  "unknown message type",
                  document["type"].get_ref<const std::string&>());
  }

  const auto phase =
      is_string_member(document, "phase")
          ? try_from_string<message_phase_t>(
                document["phase"].get_ref<const std::string&>())
          : std::nullopt;
  if (!phase || *phase != expected_phase(*type)) {
    return reject(negotiation_error_code::phase_type_mismatch,
                  "phase does not match message type",
                  std::string{to_string(*type)});
  }

  if (!is_string_member(document, "message_id") ||
      !icnp::common::is_uuid(
          document["message_id"].get_ref<const std::string&>())) {
    return reject(negotiation_error_code::invalid_message_id,
                  "message_id must be a UUID", "");
  }
  if (!is_string_member(document, "session_id") ||
      !icnp::common::is_uuid(
          document["session_id"].get_ref<const std::string&>())) {
    return reject(negotiation_error_code::invalid_session_id,
                  "session_id must be a UUID", "");
  }
  if (!is_string_member(document, "timestamp") ||
      !icnp::common::parse_rfc3339(
          document["timestamp"].get_ref<const std::string&>())) {
    return reject(negotiation_error_code::invalid_timestamp,
                  "timestamp must be RFC3339", "");
  }
  if (!valid_actor(document["sender"])) {
    return reject(negotiation_error_code::invalid_actor,
                  "sender must carry an id and a known role", "");
  }
  const auto recipient = document.find("recipient");
  if (recipient != document.end() && !recipient->is_null() &&
      !valid_actor(*recipient)) {
    return reject(negotiation_error_code::invalid_actor,
                  "recipient must carry an id and a known role", "");
  }
  const auto in_reply_to = document.find("in_reply_to");
  if (in_reply_to != document.end() && !in_reply_to->is_null() &&
      (!in_reply_to->is_string() ||
       !icnp::common::is_uuid(in_reply_to->get_ref<const std::string&>()))) {
    return reject(negotiation_error_code::invalid_message_id,
                  "in_reply_to must be a UUID", "");
  }
  if (!document["payload"].is_object()) {
    return reject(negotiation_error_code::malformed_payload,
                  "payload must be an object", "");
  }
  for (const auto* field : {"trace", "extensions"}) {
    const auto it = document.find(field);
    if (it != document.end() && !it->is_null() && !it->is_object()) {
      return reject(negotiation_error_code::malformed_envelope,
                    "opaque envelope member must be an object", field);
    }
  }

  auto encoder =
      icnp::schema::encoding::encoder<icnp::schema::encoding::json_encoder_tag>{};
  auto error = std::string{};
  auto decoded = encoder.try_decode<envelope_t>(document, error);
  if (!decoded) {
    return reject(negotiation_error_code::malformed_envelope,
                  "envelope could not be decoded", error);
  }
  out = std::move(*decoded);
  return make_success();
}

operation_result_t validator::admit(icnp::session::session_t& session,
                                    const envelope_t& envelope,
                                    bool& duplicate) const {
  duplicate = session.seen_message_ids.contains(envelope.message_id);
  if (duplicate) {
    spdlog::debug("Session {}: duplicate message {} ignored", session.id,
                  envelope.message_id);
    return make_success("duplicate");
  }
  if (envelope.in_reply_to &&
      !session.seen_message_ids.contains(*envelope.in_reply_to) &&
      !session.sent_message_ids.contains(*envelope.in_reply_to)) {
    return reject(negotiation_error_code::unresolved_reply,
                  "in_reply_to names an unknown message",
                  *envelope.in_reply_to);
  }
  session.seen_message_ids.insert(envelope.message_id);
  return make_success();
}

void validator::forget(icnp::session::session_t& session,
                       const std::string& message_id) const {
  session.seen_message_ids.erase(message_id);
}

void validator::record_sent(icnp::session::session_t& session,
                            const std::string& message_id) const {
  session.sent_message_ids.insert(message_id);
}

}  // namespace icnp::envelope
