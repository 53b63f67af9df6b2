#include <gtest/gtest.h>
#include <icnp/common/time.hpp>
#include <icnp/common/uuid.hpp>
#include <icnp/envelope/validator.hpp>
#include <icnp/testing/common.hpp>
#include <icnp/testing/documents.hpp>

#include <string>

using namespace icnp::schema;

namespace {

json_t make_document(const message_type_t type = message_type_t::audit_event) {
  auto document = json_t::object();
  document["icnp_version"] = "1.0.0";
  document["type"] = std::string{to_string(type)};
  document["phase"] = std::string{to_string(expected_phase(type))};
  document["message_id"] = icnp::common::make_uuid();
  document["session_id"] = icnp::common::make_uuid();
  document["timestamp"] =
      icnp::common::format_rfc3339(icnp::testing::kStartTime);
  document["sender"] =
      icnp::testing::make_actor_document(icnp::testing::make_agent("agent-a"));
  document["payload"] = json_t{{"event", json_t::object()}};
  return document;
}

uint32_t decode_code(const json_t& document) {
  auto validator = icnp::envelope::validator{};
  auto envelope = envelope_t{};
  auto result = validator.decode(document, envelope);
  if (!result.ok()) {
    EXPECT_EQ(result.error, error_class_t::invalid_intent);
  }
  return result.code;
}

constexpr uint32_t code_of(const negotiation_error_code code) {
  return static_cast<uint32_t>(code);
}

}  // namespace

TEST(validator, decodes_well_formed_text) {
  auto validator = icnp::envelope::validator{};
  auto document = make_document(message_type_t::intent_declaration);
  document["payload"] = icnp::testing::make_intent_payload();
  document["trace"] = json_t{{"trace_id", "t-1"}};

  auto envelope = envelope_t{};
  auto parsed = json_t{};
  auto result = validator.decode(document.dump(), envelope, parsed);
  ASSERT_TRUE(result.ok()) << result.log << " " << result.info;
  EXPECT_EQ(envelope.type, message_type_t::intent_declaration);
  EXPECT_EQ(envelope.phase, message_phase_t::intent);
  EXPECT_EQ(envelope.message_id, document["message_id"].get<std::string>());
  EXPECT_EQ(envelope.sender.id, "agent-a");
  EXPECT_EQ(parsed, document);
}

TEST(validator, rejects_text_that_is_not_json) {
  auto validator = icnp::envelope::validator{};
  auto envelope = envelope_t{};
  auto parsed = json_t{};
  auto result = validator.decode("{not json", envelope, parsed);
  EXPECT_EQ(result.code, code_of(negotiation_error_code::malformed_envelope));
  EXPECT_EQ(result.codespace, "icnp.envelope");
  EXPECT_EQ(validator.decode(json_t::array(), envelope).code,
            code_of(negotiation_error_code::malformed_envelope));
}

TEST(validator, reports_missing_field_by_name) {
  auto document = make_document();
  document.erase("timestamp");
  auto validator = icnp::envelope::validator{};
  auto envelope = envelope_t{};
  auto result = validator.decode(document, envelope);
  EXPECT_EQ(result.code, code_of(negotiation_error_code::malformed_envelope));
  EXPECT_EQ(result.info, "timestamp");
}

TEST(validator, checks_version_type_and_phase) {
  auto document = make_document();
  document["icnp_version"] = "2.0.0";
  EXPECT_EQ(decode_code(document),
            code_of(negotiation_error_code::unsupported_version));

  document = make_document();
  document["icnp_version"] = "1.4.2";
  EXPECT_EQ(decode_code(document), 0u);

  document = make_document();
  document["type"] = "gossip";
  EXPECT_EQ(decode_code(document),
            code_of(negotiation_error_code::unknown_message_type));

  document = make_document(message_type_t::execution_request);
  document["phase"] = "contract";
  EXPECT_EQ(decode_code(document),
            code_of(negotiation_error_code::phase_type_mismatch));
}

TEST(validator, checks_identifiers_timestamp_and_sender) {
  auto document = make_document();
  document["message_id"] = "msg-1";
  EXPECT_EQ(decode_code(document),
            code_of(negotiation_error_code::invalid_message_id));

  document = make_document();
  document["session_id"] = "session-1";
  EXPECT_EQ(decode_code(document),
            code_of(negotiation_error_code::invalid_session_id));

  document = make_document();
  document["timestamp"] = "yesterday";
  EXPECT_EQ(decode_code(document),
            code_of(negotiation_error_code::invalid_timestamp));

  document = make_document();
  document["sender"] = json_t{{"id", "agent-a"}, {"role", "wizard"}};
  EXPECT_EQ(decode_code(document),
            code_of(negotiation_error_code::invalid_actor));

  document = make_document();
  document["sender"] = json_t{{"id", ""}, {"role", "agent"}};
  EXPECT_EQ(decode_code(document),
            code_of(negotiation_error_code::invalid_actor));

  document = make_document();
  document["in_reply_to"] = "previous";
  EXPECT_EQ(decode_code(document),
            code_of(negotiation_error_code::invalid_message_id));
}

TEST(validator, checks_payload_and_opaque_members) {
  auto document = make_document();
  document["payload"] = "text";
  EXPECT_EQ(decode_code(document),
            code_of(negotiation_error_code::malformed_payload));

  document = make_document();
  document["extensions"] = json_t::array();
  EXPECT_EQ(decode_code(document),
            code_of(negotiation_error_code::malformed_envelope));
}

TEST(validator, admit_records_ids_and_reports_duplicates) {
  auto validator = icnp::envelope::validator{};
  auto session = icnp::session::session_t{};
  session.id = "s-1";

  auto first = envelope_t{};
  first.message_id = icnp::common::make_uuid();
  auto duplicate = true;
  EXPECT_TRUE(validator.admit(session, first, duplicate).ok());
  EXPECT_FALSE(duplicate);
  EXPECT_TRUE(validator.admit(session, first, duplicate).ok());
  EXPECT_TRUE(duplicate);

  auto reply = envelope_t{};
  reply.message_id = icnp::common::make_uuid();
  reply.in_reply_to = icnp::common::make_uuid();
  auto result = validator.admit(session, reply, duplicate);
  EXPECT_EQ(result.code, code_of(negotiation_error_code::unresolved_reply));
  EXPECT_FALSE(session.seen_message_ids.contains(reply.message_id));

  reply.in_reply_to = first.message_id;
  EXPECT_TRUE(validator.admit(session, reply, duplicate).ok());
  EXPECT_FALSE(duplicate);

  validator.forget(session, first.message_id);
  EXPECT_TRUE(validator.admit(session, first, duplicate).ok());
  EXPECT_FALSE(duplicate);
}
