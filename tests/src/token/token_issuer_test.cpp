#include <gtest/gtest.h>
#include <icnp/testing/session_fixture.hpp>
#include <icnp/token/binding.hpp>
#include <icnp/token/token_issuer.hpp>

#include <string>
#include <vector>

using namespace icnp::schema;

namespace {

constexpr uint32_t code_of(const negotiation_error_code code) {
  return static_cast<uint32_t>(code);
}

std::vector<std::string> ids_of(const std::vector<actor_t>& actors) {
  auto result = std::vector<std::string>{};
  for (const auto& actor : actors) {
    result.push_back(actor.id);
  }
  return result;
}

const agreed_action_t& agreed_at(icnp::testing::session_fixture& fixture,
                                 const std::size_t index) {
  return fixture.session().contract->contract.agreed_actions.at(index);
}

}  // namespace

TEST(token_issuer, issues_a_signed_token_for_an_accepted_contract) {
  auto fixture = icnp::testing::session_fixture{};
  fixture.negotiate(icnp::testing::make_standard_contract());

  auto token = execution_token_t{};
  auto result = fixture.issue(token);
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(result.info, "token issued");
  EXPECT_EQ(fixture.session().phase, session_phase_t::token);

  EXPECT_EQ(token.session_id, fixture.session_id());
  EXPECT_EQ(token.contract_id, "contract-1");
  EXPECT_EQ(token.issuer.id, "icnp-engine");
  EXPECT_EQ(ids_of(token.audience),
            (std::vector<std::string>{"agent-a", "agent-b"}));
  EXPECT_EQ(token.issued_at, icnp::testing::kStartTime);
  EXPECT_EQ(token.validity.not_before, icnp::testing::kStartTime);
  EXPECT_EQ(token.validity.not_after, icnp::testing::kStartTime + 600'000);
  EXPECT_EQ(token.limits.max_invocations_per_actor, 3u);
  EXPECT_EQ(token.limits.max_invocations_total, std::optional<uint32_t>{20});
  EXPECT_EQ(token.binding.intent_hash.alg, "sha256");
  EXPECT_EQ(token.binding.contract_hash.value.size(), 64u);
  EXPECT_NE(token.binding.intent_hash.value,
            token.binding.contract_hash.value);

  ASSERT_TRUE(token.signature.has_value());
  EXPECT_EQ(token.signature->alg, "hmac-sha256");
  EXPECT_EQ(token.signature->key_id, "test-key");
  EXPECT_EQ(token.signature->signed_by, "icnp-engine");

  ASSERT_NE(fixture.session().token, nullptr);
  EXPECT_TRUE(fixture.issuer().validate(*fixture.session().token,
                                        fixture.clock().now()));
  EXPECT_EQ(icnp::testing::count_events(fixture.audit(),
                                        audit_event_kind_t::token_issued),
            1u);
}

TEST(token_issuer, binding_covers_the_documents_as_received) {
  auto fixture = icnp::testing::session_fixture{};
  fixture.negotiate(icnp::testing::make_standard_contract());
  auto token = execution_token_t{};
  ASSERT_TRUE(fixture.issue(token).ok());

  const auto documents =
      icnp::token::make_binding_documents(fixture.session());
  ASSERT_TRUE(documents.has_value());
  auto error = std::string{};
  const auto binding = icnp::token::compute_binding(
      *documents, "sha256", icnp::canonical::make_default_canonicalizer(),
      error);
  ASSERT_TRUE(binding.has_value()) << error;
  EXPECT_EQ(*binding, token.binding);
}

TEST(token_issuer, refuses_until_the_contract_is_accepted) {
  auto fixture = icnp::testing::session_fixture{};
  ASSERT_TRUE(fixture.declare().ok());
  fixture.disclose_standard();

  auto token = execution_token_t{};
  EXPECT_EQ(fixture.issue(token).code,
            code_of(negotiation_error_code::contract_not_accepted));

  ASSERT_TRUE(fixture.propose(icnp::testing::make_standard_contract()).ok());
  ASSERT_TRUE(fixture.accept(icnp::testing::kAgentA, "contract-1").ok());
  const auto result = fixture.issue(token);
  EXPECT_EQ(result.code,
            code_of(negotiation_error_code::contract_not_accepted));
  EXPECT_EQ(result.error, error_class_t::token_invalid);
  EXPECT_EQ(fixture.session().phase, session_phase_t::contract);
  EXPECT_TRUE(token.token_id.empty());
}

TEST(token_issuer, approval_gate_runs_before_issue) {
  auto intent = icnp::testing::intent_settings_t{};
  intent.actions = {"write"};
  intent.risk_tolerance = "medium";
  intent.human_approval_required = true;

  auto fixture = icnp::testing::session_fixture{};
  ASSERT_TRUE(fixture.declare(intent).ok());
  ASSERT_TRUE(fixture
                  .disclose(icnp::testing::kAgentA,
                            icnp::testing::make_capability(
                                "cap-write",
                                {icnp::testing::make_capability_action(
                                    "write", {"production"}, true)}))
                  .ok());

  auto settings = icnp::testing::contract_settings_t{};
  settings.agreed_actions = {icnp::testing::make_agreed_action(
      "aa-write", "cap-write", icnp::testing::kAgentA, "write",
      "production")};
  ASSERT_TRUE(fixture.propose(settings).ok());
  EXPECT_EQ(fixture.accept(icnp::testing::kAgentA, "contract-1").code,
            code_of(negotiation_error_code::approval_missing));

  auto token = execution_token_t{};
  auto result = fixture.issue(token);
  EXPECT_EQ(result.code, code_of(negotiation_error_code::approval_missing));
  EXPECT_EQ(result.error, error_class_t::unauthorised_action);

  // A contract frozen without approvals is still refused.
  fixture.session().contract->status = contract_status_t::accepted;
  result = fixture.issue(token);
  EXPECT_EQ(result.code, code_of(negotiation_error_code::approval_missing));
  EXPECT_EQ(result.error, error_class_t::unauthorised_action);

  EXPECT_TRUE(token.token_id.empty());
  EXPECT_EQ(fixture.session().token, nullptr);
  EXPECT_EQ(fixture.session().phase, session_phase_t::contract);
  EXPECT_EQ(icnp::testing::count_events(fixture.audit(),
                                        audit_event_kind_t::token_issued),
            0u);
}

TEST(token_issuer, issues_once_per_session) {
  auto fixture = icnp::testing::session_fixture{};
  fixture.negotiate(icnp::testing::make_standard_contract());
  auto first = execution_token_t{};
  ASSERT_TRUE(fixture.issue(first).ok());

  auto second = execution_token_t{};
  EXPECT_EQ(fixture.issue(second).code,
            code_of(negotiation_error_code::token_already_issued));
  EXPECT_EQ(fixture.session().token->token.token_id, first.token_id);
}

TEST(token_issuer, contract_constraints_set_the_limits) {
  auto settings = icnp::testing::make_standard_contract();
  settings.constraints = json_t{{"max_invocations_per_actor", 1},
                                {"max_invocations_total", 5}};
  auto fixture = icnp::testing::session_fixture{};
  fixture.negotiate(settings);

  auto token = execution_token_t{};
  ASSERT_TRUE(fixture.issue(token).ok());
  EXPECT_EQ(token.limits.max_invocations_per_actor, 1u);
  EXPECT_EQ(token.limits.max_invocations_total, std::optional<uint32_t>{5});
}

TEST(token_issuer, blake3_binding_when_configured) {
  auto options = icnp::testing::make_test_options();
  options.binding_hash_algorithm = "blake3";
  auto fixture = icnp::testing::session_fixture{options};
  fixture.negotiate(icnp::testing::make_standard_contract());

  auto token = execution_token_t{};
  ASSERT_TRUE(fixture.issue(token).ok());
  EXPECT_EQ(token.binding.intent_hash.alg, "blake3");
  EXPECT_EQ(token.binding.capabilities_hash.alg, "blake3");
  EXPECT_EQ(token.binding.capabilities_hash.value.size(), 64u);
}

TEST(token_issuer, validity_window_is_half_open) {
  auto fixture = icnp::testing::session_fixture{};
  fixture.negotiate(icnp::testing::make_standard_contract());
  auto token = execution_token_t{};
  ASSERT_TRUE(fixture.issue(token).ok());
  const auto& issued = *fixture.session().token;

  EXPECT_TRUE(fixture.issuer().check(issued, token.validity.not_after - 1).ok());
  EXPECT_EQ(fixture.issuer().check(issued, token.validity.not_after).code,
            code_of(negotiation_error_code::token_expired));
  EXPECT_EQ(fixture.issuer().check(issued, token.validity.not_before - 1).code,
            code_of(negotiation_error_code::token_not_yet_valid));
  EXPECT_FALSE(fixture.issuer().validate(issued, token.validity.not_after));
}

TEST(token_issuer, altered_body_fails_signature_check) {
  auto fixture = icnp::testing::session_fixture{};
  fixture.negotiate(icnp::testing::make_standard_contract());
  auto token = execution_token_t{};
  ASSERT_TRUE(fixture.issue(token).ok());

  auto& issued = *fixture.session().token;
  ASSERT_FALSE(issued.signed_body.empty());
  issued.signed_body.front() ^= 0x01;
  const auto result = fixture.issuer().check(issued, fixture.clock().now());
  EXPECT_EQ(result.code,
            code_of(negotiation_error_code::token_signature_invalid));
  EXPECT_EQ(result.error, error_class_t::token_invalid);
}

TEST(token_issuer, revocation_is_idempotent) {
  auto fixture = icnp::testing::session_fixture{};
  fixture.negotiate(icnp::testing::make_standard_contract());
  auto token = execution_token_t{};
  ASSERT_TRUE(fixture.issue(token).ok());

  EXPECT_EQ(fixture.issuer()
                .revoke(fixture.session(), "not-a-token", std::nullopt,
                        fixture.clock().now())
                .code,
            code_of(negotiation_error_code::token_missing));

  auto first = fixture.issuer().revoke(fixture.session(), token.token_id,
                                       std::string{"compromised"},
                                       fixture.clock().now());
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(first.info, "token revoked");
  auto second = fixture.issuer().revoke(fixture.session(), token.token_id,
                                        std::nullopt, fixture.clock().now());
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(second.info, "already revoked");

  EXPECT_EQ(fixture.issuer()
                .check(*fixture.session().token, fixture.clock().now())
                .code,
            code_of(negotiation_error_code::token_revoked));
  EXPECT_EQ(icnp::testing::count_events(fixture.audit(),
                                        audit_event_kind_t::token_revoked),
            1u);
}

TEST(token_issuer, resolve_matches_the_session_token_only) {
  auto fixture = icnp::testing::session_fixture{};
  fixture.negotiate(icnp::testing::make_standard_contract());
  EXPECT_EQ(icnp::token::token_issuer::resolve(fixture.session(), "x"),
            nullptr);

  auto token = execution_token_t{};
  ASSERT_TRUE(fixture.issue(token).ok());
  EXPECT_EQ(icnp::token::token_issuer::resolve(fixture.session(),
                                               token.token_id),
            fixture.session().token);
  EXPECT_EQ(icnp::token::token_issuer::resolve(fixture.session(), "x"),
            nullptr);
}

TEST(token_issuer, per_actor_limit_leaves_counters_untouched) {
  auto settings = icnp::testing::make_standard_contract();
  settings.constraints = json_t{{"max_invocations_per_actor", 2}};
  auto fixture = icnp::testing::session_fixture{};
  fixture.negotiate(settings);
  auto token = execution_token_t{};
  ASSERT_TRUE(fixture.issue(token).ok());
  auto& issued = *fixture.session().token;

  for (auto i = 0; i < 2; ++i) {
    ASSERT_TRUE(fixture.issuer()
                    .try_consume(fixture.session(), issued,
                                 agreed_at(fixture, 0), "agent-a")
                    .ok());
  }
  const auto refused = fixture.issuer().try_consume(
      fixture.session(), issued, agreed_at(fixture, 0), "agent-a");
  EXPECT_EQ(refused.code,
            code_of(negotiation_error_code::per_actor_limit_exceeded));
  EXPECT_EQ(refused.error, error_class_t::unauthorised_action);
  EXPECT_EQ(issued.invocations_total.load(), 2u);
  EXPECT_EQ(fixture.session().invocations_per_actor.at("agent-a"), 2u);
  EXPECT_EQ(fixture.session().invocations_per_action.at("aa-search"), 2u);

  EXPECT_TRUE(fixture.issuer()
                  .try_consume(fixture.session(), issued,
                               agreed_at(fixture, 1), "agent-b")
                  .ok());
}

TEST(token_issuer, agreed_action_limit) {
  auto settings = icnp::testing::make_standard_contract();
  settings.agreed_actions[0] = icnp::testing::make_agreed_action(
      "aa-search", "cap-search", icnp::testing::kAgentA, "search", "web", 1);
  auto fixture = icnp::testing::session_fixture{};
  fixture.negotiate(settings);
  auto token = execution_token_t{};
  ASSERT_TRUE(fixture.issue(token).ok());
  auto& issued = *fixture.session().token;

  ASSERT_TRUE(fixture.issuer()
                  .try_consume(fixture.session(), issued,
                               agreed_at(fixture, 0), "agent-a")
                  .ok());
  EXPECT_EQ(fixture.issuer()
                .try_consume(fixture.session(), issued, agreed_at(fixture, 0),
                             "agent-a")
                .code,
            code_of(negotiation_error_code::action_limit_exceeded));
  EXPECT_EQ(issued.invocations_total.load(), 1u);
}

TEST(token_issuer, total_limit_is_shared_by_all_actors) {
  auto settings = icnp::testing::make_standard_contract();
  settings.constraints = json_t{{"max_invocations_total", 1}};
  auto fixture = icnp::testing::session_fixture{};
  fixture.negotiate(settings);
  auto token = execution_token_t{};
  ASSERT_TRUE(fixture.issue(token).ok());
  auto& issued = *fixture.session().token;

  ASSERT_TRUE(fixture.issuer()
                  .try_consume(fixture.session(), issued,
                               agreed_at(fixture, 0), "agent-a")
                  .ok());
  EXPECT_EQ(fixture.issuer()
                .try_consume(fixture.session(), issued, agreed_at(fixture, 1),
                             "agent-b")
                .code,
            code_of(negotiation_error_code::total_limit_exceeded));
  EXPECT_FALSE(fixture.session().invocations_per_actor.contains("agent-b"));
}

TEST(token_issuer, foreign_tokens_must_match_the_session) {
  auto issuing = icnp::testing::session_fixture{};
  issuing.negotiate(icnp::testing::make_standard_contract());
  auto token = execution_token_t{};
  ASSERT_TRUE(issuing.issue(token).ok());
  const auto document = icnp::testing::json_encoder_t{}.to_document(token);

  auto receiving = icnp::testing::session_fixture{};
  receiving.negotiate(icnp::testing::make_standard_contract());

  auto result = receiving.issuer().accept_external(
      receiving.session(), token, document, receiving.clock().now());
  EXPECT_EQ(result.code,
            code_of(negotiation_error_code::token_session_mismatch));

  // Same ids, but the contract document names the issuing session.
  auto relabelled = token;
  relabelled.session_id = receiving.session_id();
  auto relabelled_document = document;
  relabelled_document["session_id"] = receiving.session_id();
  result = receiving.issuer().accept_external(receiving.session(), relabelled,
                                              relabelled_document,
                                              receiving.clock().now());
  EXPECT_EQ(result.code,
            code_of(negotiation_error_code::token_binding_mismatch));
  EXPECT_EQ(receiving.session().phase, session_phase_t::contract);
  EXPECT_EQ(receiving.session().token, nullptr);
}
