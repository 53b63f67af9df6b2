#include <gtest/gtest.h>
#include <icnp/schema/encoding/json/encoder.hpp>
#include <icnp/testing/documents.hpp>
#include <icnp/testing/session_fixture.hpp>

#include <string>

using namespace icnp::schema;

namespace {

using encoder_t = encoding::encoder<encoding::json_encoder_tag>;

execution_token_t make_token() {
  auto token = execution_token_t{};
  token.token_id = "tok-1";
  token.session_id = "session-1";
  token.contract_id = "contract-1";
  token.issuer = icnp::testing::make_initiator();
  token.audience = {icnp::testing::make_agent("agent-a")};
  token.issued_at = icnp::testing::kStartTime;
  token.validity = {.not_before = icnp::testing::kStartTime,
                    .not_after = icnp::testing::kStartTime + 60'000};
  token.limits = {.max_invocations_total = 5, .max_invocations_per_actor = 2};
  token.binding.intent_hash = {.alg = "sha256", .value = "aa"};
  token.binding.contract_hash = {.alg = "sha256", .value = "bb"};
  token.binding.capabilities_hash = {.alg = "sha256", .value = "cc"};
  return token;
}

}  // namespace

TEST(json_encoding, intent_declaration_reads_top_level_constraints) {
  auto settings = icnp::testing::intent_settings_t{};
  settings.risk_tolerance = "high";
  settings.human_approval_required = true;
  auto declaration = icnp::testing::decode_document<intent_declaration_t>(
      icnp::testing::make_intent_payload(settings));

  EXPECT_EQ(declaration.intent.goal, "Summarize public material on a topic");
  ASSERT_EQ(declaration.intent.requested_actions.size(), 2u);
  EXPECT_EQ(declaration.intent.requested_actions[0].action, "search");
  EXPECT_EQ(declaration.intent.constraints.risk_tolerance,
            risk_tolerance_t::high);
  EXPECT_TRUE(declaration.intent.constraints.human_approval_required);
  EXPECT_FALSE(declaration.intent.constraints.external_side_effects_allowed);
}

TEST(json_encoding, intent_without_goal_still_decodes) {
  auto payload = json_t::object();
  payload["intent"] = json_t::object();
  auto encoder = encoder_t{};
  auto error = std::string{};
  auto decoded = encoder.try_decode<intent_declaration_t>(payload, error);
  ASSERT_TRUE(decoded.has_value()) << error;
  EXPECT_TRUE(decoded->intent.goal.empty());
}

TEST(json_encoding, capability_requires_numeric_confidence) {
  auto document = icnp::testing::make_search_capability();
  auto typed = icnp::testing::decode_document<capability_t>(document);
  ASSERT_EQ(typed.actions.size(), 1u);
  EXPECT_EQ(typed.actions[0].scopes,
            (std::vector<std::string>{"web", "internal"}));
  EXPECT_DOUBLE_EQ(typed.actions[0].confidence, 0.9);
  EXPECT_EQ(typed.actions[0].effects, "none");

  document["actions"][0]["confidence"] = "high";
  auto encoder = encoder_t{};
  auto error = std::string{};
  EXPECT_FALSE(encoder.try_decode<capability_t>(document, error).has_value());
  EXPECT_NE(error.find("confidence"), std::string::npos);
}

TEST(json_encoding, contract_signatures_accept_object_and_array_forms) {
  auto document = icnp::testing::make_contract_document(
      "session-1", icnp::testing::make_standard_contract());
  auto signature = json_t::object();
  signature["alg"] = "hmac-sha256";
  signature["value"] = "c2ln";
  signature["key_id"] = "k";
  signature["signed_by"] = "agent-a";
  signature["signed_at"] = "2023-11-14T22:13:20Z";

  document["signatures"] = json_t::array({signature});
  auto from_array = icnp::testing::decode_document<contract_t>(document);
  ASSERT_EQ(from_array.signatures.count("agent-a"), 1u);

  auto encoder = encoder_t{};
  auto written = encoder.to_document(from_array);
  ASSERT_TRUE(written["signatures"].is_object());
  EXPECT_EQ(written["signatures"]["agent-a"]["value"], "c2ln");

  auto from_object = icnp::testing::decode_document<contract_t>(written);
  EXPECT_EQ(from_object.signatures, from_array.signatures);
  EXPECT_EQ(from_object.agreed_actions.size(), 2u);
  EXPECT_EQ(from_object.forbidden_actions[0].scope, "internal");
  EXPECT_EQ(from_object.enforcement.mode, enforcement_mode_t::strict);
}

TEST(json_encoding, contract_rejects_unknown_enforcement_mode) {
  auto settings = icnp::testing::make_standard_contract();
  settings.mode = "lenient";
  auto encoder = encoder_t{};
  auto error = std::string{};
  EXPECT_FALSE(encoder
                   .try_decode<contract_t>(
                       icnp::testing::make_contract_document("s", settings),
                       error)
                   .has_value());
  EXPECT_NE(error.find("lenient"), std::string::npos);
}

TEST(json_encoding, token_writes_rfc3339_instants_and_nested_validity) {
  auto token = make_token();
  auto encoder = encoder_t{};
  auto document = encoder.to_document(token);

  EXPECT_EQ(document["issued_at"], "2023-11-14T22:13:20Z");
  EXPECT_EQ(document["validity"]["not_after"], "2023-11-14T22:14:20Z");
  EXPECT_EQ(document["revocation"]["method"], "out_of_band");
  EXPECT_FALSE(document.contains("signature"));

  auto error = std::string{};
  auto decoded = encoder.try_decode<execution_token_t>(document, error);
  ASSERT_TRUE(decoded.has_value()) << error;
  EXPECT_EQ(decoded->validity, token.validity);
  EXPECT_EQ(decoded->limits, token.limits);
  EXPECT_EQ(decoded->binding, token.binding);
}

TEST(json_encoding, token_signing_body_excludes_signature) {
  auto token = make_token();
  token.signature = signature_t{.alg = "hmac-sha256",
                                .value = "c2ln",
                                .key_id = "k",
                                .signed_by = "orchestrator-1",
                                .signed_at = "2023-11-14T22:13:20Z"};
  auto encoder = encoder_t{};
  auto document = encoder.to_document(token);
  EXPECT_TRUE(document.contains("signature"));
  auto body = make_signing_body(token);
  EXPECT_FALSE(body.contains("signature"));
  document.erase("signature");
  EXPECT_EQ(body, document);
}

TEST(json_encoding, token_reads_flat_validity) {
  auto encoder = encoder_t{};
  auto document = encoder.to_document(make_token());
  document["not_before"] = document["validity"]["not_before"];
  document["not_after"] = document["validity"]["not_after"];
  document.erase("validity");
  auto error = std::string{};
  auto decoded = encoder.try_decode<execution_token_t>(document, error);
  ASSERT_TRUE(decoded.has_value()) << error;
  EXPECT_EQ(decoded->validity.not_after, icnp::testing::kStartTime + 60'000);

  document["not_after"] = "tomorrow";
  EXPECT_FALSE(encoder.try_decode<execution_token_t>(document, error));
}

TEST(json_encoding, acceptance_requires_a_contract_reference) {
  auto payload = json_t::object();
  payload["decision"] = "accept";
  auto error = std::string{};
  EXPECT_FALSE(try_decode_payload(message_type_t::contract_acceptance, payload,
                                  error)
                   .has_value());

  payload["contract_id"] = "contract-1";
  auto decoded =
      try_decode_payload(message_type_t::contract_acceptance, payload, error);
  ASSERT_TRUE(decoded.has_value()) << error;
  ASSERT_TRUE(std::holds_alternative<contract_acceptance_t>(*decoded));
  EXPECT_EQ(std::get<contract_acceptance_t>(*decoded).contract_id,
            "contract-1");
}

TEST(json_encoding, payload_dispatch_follows_message_type) {
  auto error = std::string{};
  auto audit = try_decode_payload(message_type_t::audit_event,
                                  json_t{{"event", {{"k", 1}}}}, error);
  ASSERT_TRUE(audit.has_value()) << error;
  EXPECT_TRUE(std::holds_alternative<audit_event_message_t>(*audit));

  EXPECT_FALSE(try_decode_payload(message_type_t::audit_event,
                                  json_t{{"event", "text"}}, error));
  EXPECT_FALSE(try_decode_payload(message_type_t::contract_rejection,
                                  json_t::object(), error));
}

TEST(json_encoding, envelope_requires_object_payload) {
  auto document = json_t::object();
  document["icnp_version"] = "1.0.0";
  document["type"] = "audit_event";
  document["phase"] = "audit";
  document["message_id"] = "m";
  document["session_id"] = "s";
  document["timestamp"] = "2023-11-14T22:13:20Z";
  document["sender"] = icnp::testing::make_actor_document(
      icnp::testing::make_agent("agent-a"));
  document["payload"] = json_t::object();
  document["trace"] = json_t{{"span", "abc"}};

  auto encoder = encoder_t{};
  auto error = std::string{};
  auto decoded = encoder.try_decode<envelope_t>(document, error);
  ASSERT_TRUE(decoded.has_value()) << error;
  EXPECT_EQ(decoded->type, message_type_t::audit_event);
  EXPECT_EQ(decoded->sender.role, actor_role_t::agent);
  ASSERT_TRUE(decoded->trace.has_value());
  EXPECT_EQ((*decoded->trace)["span"], "abc");

  document["payload"] = json_t::array();
  EXPECT_FALSE(encoder.try_decode<envelope_t>(document, error));
}

TEST(json_encoding, enum_names_map_both_ways) {
  EXPECT_EQ(to_string(message_type_t::contract_counterproposal),
            "contract_counterproposal");
  EXPECT_EQ(try_from_string<session_phase_t>("expired"),
            session_phase_t::expired);
  EXPECT_FALSE(try_from_string<actor_role_t>("robot").has_value());
  EXPECT_EQ(to_protocol_code(error_class_t::token_invalid), "ICNP-005");
  EXPECT_EQ(from_protocol_code("ICNP-002"), error_class_t::capability_mismatch);
  EXPECT_EQ(expected_phase(message_type_t::execution_result),
            message_phase_t::execution);
}
