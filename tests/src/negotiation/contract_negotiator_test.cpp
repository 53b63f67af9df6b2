#include <gtest/gtest.h>
#include <icnp/canonical/canonicalize.hpp>
#include <icnp/negotiation/contract_negotiator.hpp>
#include <icnp/testing/session_fixture.hpp>

#include <string>

using namespace icnp::schema;

namespace {

constexpr uint32_t code_of(const negotiation_error_code code) {
  return static_cast<uint32_t>(code);
}

contract_t make_contract(const icnp::testing::contract_settings_t& settings =
                             icnp::testing::make_standard_contract()) {
  return icnp::testing::decode_document<contract_t>(
      icnp::testing::make_contract_document("session-1", settings));
}

// HMAC signature over the contract as proposed, made with the test key.
signature_t sign_contract(const json_t& document, const std::string& signer) {
  auto error = std::string{};
  auto body = icnp::canonical::canonicalize(
      icnp::negotiation::make_contract_signing_body(document), error);
  EXPECT_TRUE(body.has_value()) << error;
  auto value = icnp::testing::make_test_signer().sign(
      make_bytes_view(body.value_or(bytes_t{})),
      std::string{icnp::testing::kSigningKeyId});
  EXPECT_TRUE(value.has_value());
  const auto raw = value.value_or(bytes_t{});
  return signature_t{.alg = "hmac-sha256",
                     .value = to_base64(make_bytes_view(raw)),
                     .key_id = std::string{icnp::testing::kSigningKeyId},
                     .signed_by = signer,
                     .signed_at = "2023-11-14T22:13:20Z"};
}

}  // namespace

TEST(contract_rules, forbidden_entries_dominate_agreed_actions) {
  auto settings = icnp::testing::make_standard_contract();
  settings.agreed_actions.push_back(icnp::testing::make_agreed_action(
      "aa-internal", "cap-search", icnp::testing::kAgentA, "search",
      "internal"));
  auto contract = make_contract(settings);

  EXPECT_TRUE(icnp::negotiation::contract_negotiator::forbids(
      contract, "search", "internal"));
  EXPECT_FALSE(icnp::negotiation::contract_negotiator::forbids(
      contract, "search", "web"));

  auto effective =
      icnp::negotiation::contract_negotiator::effective_actions(contract);
  ASSERT_EQ(effective.size(), 2u);
  EXPECT_EQ(effective[0]->action_id, "aa-search");
  EXPECT_EQ(effective[1]->action_id, "aa-summarize");
}

TEST(contract_rules, wildcard_or_missing_scope_forbids_every_scope) {
  for (const auto& scope :
       {std::optional<std::string>{}, std::optional<std::string>{"any"},
        std::optional<std::string>{"*"}}) {
    auto settings = icnp::testing::make_standard_contract();
    settings.forbidden_actions = {
        icnp::testing::make_forbidden_action("search", scope)};
    auto contract = make_contract(settings);
    EXPECT_TRUE(icnp::negotiation::contract_negotiator::forbids(
        contract, "search", "web"));
    EXPECT_FALSE(icnp::negotiation::contract_negotiator::is_authorized(
        contract, "search", icnp::testing::kAgentA, std::string{"web"}));
    EXPECT_TRUE(icnp::negotiation::contract_negotiator::is_authorized(
        contract, "summarize", icnp::testing::kAgentB, std::string{"text"}));
  }
}

TEST(contract_rules, authorize_matches_executor_action_and_scope) {
  auto contract = make_contract();
  const auto* agreed = icnp::negotiation::contract_negotiator::authorize(
      contract, "search", icnp::testing::kAgentA, std::string{"web"});
  ASSERT_NE(agreed, nullptr);
  EXPECT_EQ(agreed->action_id, "aa-search");

  EXPECT_NE(icnp::negotiation::contract_negotiator::authorize(
                contract, "search", icnp::testing::kAgentA, std::nullopt),
            nullptr);
  EXPECT_EQ(icnp::negotiation::contract_negotiator::authorize(
                contract, "search", icnp::testing::kAgentB, std::string{"web"}),
            nullptr);
  EXPECT_EQ(icnp::negotiation::contract_negotiator::authorize(
                contract, "search", icnp::testing::kAgentA,
                std::string{"internal"}),
            nullptr);
  EXPECT_EQ(icnp::negotiation::contract_negotiator::authorize(
                contract, "delete", icnp::testing::kAgentA, std::nullopt),
            nullptr);
}

TEST(contract_rules, required_signers_are_unique_executors) {
  auto settings = icnp::testing::make_standard_contract();
  settings.agreed_actions.push_back(icnp::testing::make_agreed_action(
      "aa-search-2", "cap-search", icnp::testing::kAgentA, "search", "web"));
  EXPECT_EQ(icnp::negotiation::contract_negotiator::required_signers(
                make_contract(settings)),
            (std::vector<std::string>{"agent-a", "agent-b"}));
}

TEST(contract_negotiator, proposal_moves_session_to_contract_phase) {
  auto fixture = icnp::testing::session_fixture{};
  ASSERT_TRUE(fixture.declare().ok());
  fixture.disclose_standard();

  ASSERT_TRUE(fixture.propose(icnp::testing::make_standard_contract()).ok());
  EXPECT_EQ(fixture.session().phase, session_phase_t::contract);
  ASSERT_TRUE(fixture.session().contract.has_value());
  EXPECT_EQ(fixture.session().contract->status, contract_status_t::proposed);
  EXPECT_EQ(fixture.session().contract->proposer_id, "orchestrator-1");
  EXPECT_EQ(fixture.session().contract->revision, 0u);
  EXPECT_EQ(icnp::testing::count_events(fixture.audit(),
                                        audit_event_kind_t::contract_proposed),
            1u);
}

TEST(contract_negotiator, proposal_needs_capability_phase_and_initiator) {
  auto fixture = icnp::testing::session_fixture{};
  ASSERT_TRUE(fixture.declare().ok());
  EXPECT_EQ(fixture.propose(icnp::testing::make_standard_contract()).code,
            code_of(negotiation_error_code::contract_phase_closed));

  fixture.disclose_standard();
  const auto document = icnp::testing::make_contract_document(
      fixture.session_id(), icnp::testing::make_standard_contract());
  auto result = fixture.negotiator().propose(
      fixture.session(), icnp::testing::make_agent("agent-a"),
      icnp::testing::decode_document<contract_t>(document), document,
      fixture.clock().now());
  EXPECT_EQ(result.code,
            code_of(negotiation_error_code::proposer_not_initiator));
  EXPECT_EQ(result.error, error_class_t::unauthorised_action);
}

TEST(contract_negotiator, drafts_must_match_disclosed_capabilities) {
  auto fixture = icnp::testing::session_fixture{};
  ASSERT_TRUE(fixture.declare().ok());
  fixture.disclose_standard();

  auto wrong_owner = icnp::testing::make_standard_contract("c-owner");
  wrong_owner.agreed_actions[0] = icnp::testing::make_agreed_action(
      "aa-search", "cap-search", icnp::testing::kAgentB, "search", "web");
  EXPECT_EQ(fixture.propose(wrong_owner).code,
            code_of(negotiation_error_code::capability_owner_mismatch));

  auto unknown = icnp::testing::make_standard_contract("c-unknown");
  unknown.agreed_actions[0] = icnp::testing::make_agreed_action(
      "aa-x", "cap-missing", icnp::testing::kAgentA, "search", "web");
  EXPECT_EQ(fixture.propose(unknown).code,
            code_of(negotiation_error_code::capability_missing));

  auto bad_scope = icnp::testing::make_standard_contract("c-scope");
  bad_scope.agreed_actions[0] = icnp::testing::make_agreed_action(
      "aa-search", "cap-search", icnp::testing::kAgentA, "search", "darknet");
  EXPECT_EQ(fixture.propose(bad_scope).code,
            code_of(negotiation_error_code::capability_scope_missing));

  auto bad_action = icnp::testing::make_standard_contract("c-action");
  bad_action.agreed_actions[0] = icnp::testing::make_agreed_action(
      "aa-search", "cap-search", icnp::testing::kAgentA, "delete", "web");
  EXPECT_EQ(fixture.propose(bad_action).code,
            code_of(negotiation_error_code::capability_action_missing));

  auto empty = icnp::testing::make_standard_contract("c-empty");
  empty.agreed_actions.clear();
  EXPECT_EQ(fixture.propose(empty).code,
            code_of(negotiation_error_code::contract_empty));
  EXPECT_EQ(fixture.session().phase, session_phase_t::capability);
}

TEST(contract_negotiator, side_effects_need_intent_permission) {
  auto fixture = icnp::testing::session_fixture{};
  ASSERT_TRUE(fixture.declare().ok());
  fixture.disclose_standard(false, "writes external index");
  auto result = fixture.propose(icnp::testing::make_standard_contract());
  EXPECT_EQ(result.code,
            code_of(negotiation_error_code::side_effects_forbidden));
  EXPECT_EQ(result.error, error_class_t::constraints_unsatisfiable);
}

TEST(contract_negotiator, constraints_may_not_loosen_the_intent) {
  auto fixture = icnp::testing::session_fixture{};
  ASSERT_TRUE(fixture.declare().ok());
  fixture.disclose_standard();

  auto riskier = icnp::testing::make_standard_contract("c-risk");
  riskier.constraints = json_t{{"risk_tolerance", "high"}};
  EXPECT_EQ(fixture.propose(riskier).code,
            code_of(negotiation_error_code::constraints_loosened));

  auto effects = icnp::testing::make_standard_contract("c-effects");
  effects.constraints = json_t{{"external_side_effects_allowed", true}};
  EXPECT_EQ(fixture.propose(effects).code,
            code_of(negotiation_error_code::constraints_loosened));

  auto tighter = icnp::testing::make_standard_contract("c-tight");
  tighter.constraints = json_t{{"risk_tolerance", "none"}};
  EXPECT_TRUE(fixture.propose(tighter).ok());
}

TEST(contract_negotiator, invocation_limits_must_be_positive) {
  auto fixture = icnp::testing::session_fixture{};
  ASSERT_TRUE(fixture.declare().ok());
  fixture.disclose_standard();

  auto unusable = icnp::testing::make_standard_contract("c-zero-total");
  unusable.constraints = json_t{{"max_invocations_total", 0}};
  const auto refused = fixture.propose(unusable);
  EXPECT_EQ(refused.code,
            code_of(negotiation_error_code::invocation_limit_invalid));
  EXPECT_EQ(refused.error, error_class_t::constraints_unsatisfiable);
  EXPECT_EQ(refused.info, "max_invocations_total");

  auto negative = icnp::testing::make_standard_contract("c-negative");
  negative.constraints = json_t{{"max_invocations_per_actor", -1}};
  EXPECT_EQ(fixture.propose(negative).code,
            code_of(negotiation_error_code::invocation_limit_invalid));

  auto zero_action = icnp::testing::make_standard_contract("c-zero-action");
  zero_action.agreed_actions.front() = icnp::testing::make_agreed_action(
      "aa-search", "cap-search", icnp::testing::kAgentA, "search", "web", 0);
  EXPECT_EQ(fixture.propose(zero_action).code,
            code_of(negotiation_error_code::invocation_limit_invalid));

  auto limited = icnp::testing::make_standard_contract("c-limited");
  limited.constraints = json_t{{"max_invocations_total", 1}};
  EXPECT_TRUE(fixture.propose(limited).ok());
}

TEST(contract_negotiator, full_coverage_requires_every_requested_action) {
  auto options = icnp::testing::make_test_options();
  options.require_full_coverage = true;
  auto fixture = icnp::testing::session_fixture{options};
  ASSERT_TRUE(fixture.declare().ok());
  fixture.disclose_standard();

  auto partial = icnp::testing::make_standard_contract();
  partial.agreed_actions.pop_back();
  EXPECT_EQ(fixture.propose(partial).code,
            code_of(negotiation_error_code::requested_action_uncovered));
  EXPECT_TRUE(fixture.propose(icnp::testing::make_standard_contract()).ok());
}

TEST(contract_negotiator, every_executor_must_sign) {
  auto fixture = icnp::testing::session_fixture{};
  ASSERT_TRUE(fixture.declare().ok());
  fixture.disclose_standard();
  ASSERT_TRUE(fixture.propose(icnp::testing::make_standard_contract()).ok());

  auto first = fixture.accept(icnp::testing::kAgentA, "contract-1");
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(first.info, "signature recorded");
  EXPECT_EQ(fixture.session().contract->status, contract_status_t::proposed);
  EXPECT_EQ(fixture.session().contract->contract.signatures.at("agent-a").alg,
            "envelope");

  auto outsider = fixture.accept("agent-z", "contract-1");
  EXPECT_EQ(outsider.code, code_of(negotiation_error_code::signer_not_party));

  auto second = fixture.accept(icnp::testing::kAgentB, "contract-1");
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(second.info, "contract accepted");
  EXPECT_EQ(fixture.session().contract->status, contract_status_t::accepted);
  EXPECT_EQ(fixture.session().contract->accepted_at, fixture.clock().now());
  EXPECT_EQ(fixture.session().phase, session_phase_t::contract);

  EXPECT_EQ(fixture.accept(icnp::testing::kAgentA, "contract-1").code,
            code_of(negotiation_error_code::contract_already_accepted));
  EXPECT_EQ(icnp::testing::count_events(fixture.audit(),
                                        audit_event_kind_t::contract_signed),
            2u);
  EXPECT_EQ(icnp::testing::count_events(fixture.audit(),
                                        audit_event_kind_t::contract_accepted),
            1u);
}

TEST(contract_negotiator, attached_signatures_are_verified) {
  auto fixture = icnp::testing::session_fixture{};
  ASSERT_TRUE(fixture.declare().ok());
  fixture.disclose_standard();
  ASSERT_TRUE(fixture.propose(icnp::testing::make_standard_contract()).ok());
  const auto document = fixture.session().contract->document;

  auto forged = sign_contract(document, "agent-a");
  forged.value = to_base64(make_bytes_view(std::string_view{"forged"}));
  auto result = fixture.negotiator().accept(
      fixture.session(), "contract-1", icnp::testing::make_agent("agent-a"),
      forged, fixture.clock().now());
  EXPECT_EQ(result.code, code_of(negotiation_error_code::signature_invalid));

  auto foreign = sign_contract(document, "agent-b");
  result = fixture.negotiator().accept(
      fixture.session(), "contract-1", icnp::testing::make_agent("agent-a"),
      foreign, fixture.clock().now());
  EXPECT_EQ(result.code, code_of(negotiation_error_code::signature_invalid));

  auto genuine = sign_contract(document, "agent-a");
  result = fixture.negotiator().accept(
      fixture.session(), "contract-1", icnp::testing::make_agent("agent-a"),
      genuine, fixture.clock().now());
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(fixture.session().contract->contract.signatures.at("agent-a"),
            genuine);
}

TEST(contract_negotiator, counter_proposal_supersedes_and_clears_signatures) {
  auto fixture = icnp::testing::session_fixture{};
  ASSERT_TRUE(fixture.declare().ok());
  fixture.disclose_standard();
  ASSERT_TRUE(fixture.propose(icnp::testing::make_standard_contract()).ok());
  ASSERT_TRUE(fixture.accept(icnp::testing::kAgentA, "contract-1").ok());

  const auto counter = icnp::testing::make_contract_document(
      fixture.session_id(), icnp::testing::make_standard_contract("contract-2"));
  ASSERT_TRUE(fixture.negotiator()
                  .counter_propose(
                      fixture.session(), icnp::testing::make_agent("agent-b"),
                      icnp::testing::decode_document<contract_t>(counter),
                      counter, fixture.clock().now())
                  .ok());
  EXPECT_EQ(fixture.session().contract->contract.contract_id, "contract-2");
  EXPECT_EQ(fixture.session().contract->revision, 1u);
  EXPECT_EQ(fixture.session().contract->proposer_id, "agent-b");
  EXPECT_TRUE(fixture.session().contract->contract.signatures.empty());

  EXPECT_EQ(fixture.accept(icnp::testing::kAgentA, "contract-1").code,
            code_of(negotiation_error_code::contract_superseded));
  EXPECT_EQ(fixture.propose(icnp::testing::make_standard_contract()).code,
            code_of(negotiation_error_code::contract_id_reused));

  ASSERT_TRUE(fixture.accept(icnp::testing::kAgentA, "contract-2").ok());
  ASSERT_TRUE(fixture.accept(icnp::testing::kAgentB, "contract-2").ok());
  EXPECT_EQ(fixture.session().contract->status, contract_status_t::accepted);
}

TEST(contract_negotiator, approval_gate_holds_the_final_signature) {
  auto intent = icnp::testing::intent_settings_t{};
  intent.human_approval_required = true;

  auto fixture = icnp::testing::session_fixture{};
  ASSERT_TRUE(fixture.declare(intent).ok());
  fixture.disclose_standard();
  ASSERT_TRUE(fixture.propose(icnp::testing::make_standard_contract()).ok());
  ASSERT_TRUE(fixture.accept(icnp::testing::kAgentA, "contract-1").ok());
  auto held = fixture.accept(icnp::testing::kAgentB, "contract-1");
  EXPECT_EQ(held.code, code_of(negotiation_error_code::approval_missing));
  EXPECT_EQ(fixture.session().contract->status, contract_status_t::proposed);
  EXPECT_FALSE(
      fixture.session().contract->contract.signatures.contains("agent-b"));

  auto approved = icnp::testing::make_standard_contract("contract-2");
  approved.approvals =
      json_t::array({icnp::testing::make_approval(
          icnp::testing::make_agent("reviewer"))});
  const auto counter =
      icnp::testing::make_contract_document(fixture.session_id(), approved);
  ASSERT_TRUE(fixture.negotiator()
                  .counter_propose(
                      fixture.session(), icnp::testing::make_initiator(),
                      icnp::testing::decode_document<contract_t>(counter),
                      counter, fixture.clock().now())
                  .ok());
  ASSERT_TRUE(fixture.accept(icnp::testing::kAgentA, "contract-2").ok());
  EXPECT_TRUE(fixture.accept(icnp::testing::kAgentB, "contract-2").ok());
}

TEST(contract_negotiator, rejected_approval_blocks_acceptance) {
  auto fixture = icnp::testing::session_fixture{};
  ASSERT_TRUE(fixture.declare().ok());
  fixture.disclose_standard(true);

  auto settings = icnp::testing::make_standard_contract();
  settings.approvals = json_t::array(
      {icnp::testing::make_approval(icnp::testing::make_agent("reviewer"),
                                    "approve"),
       icnp::testing::make_approval(icnp::testing::make_agent("auditor"),
                                    "reject")});
  ASSERT_TRUE(fixture.propose(settings).ok());
  ASSERT_TRUE(fixture.accept(icnp::testing::kAgentA, "contract-1").ok());
  EXPECT_EQ(fixture.accept(icnp::testing::kAgentB, "contract-1").code,
            code_of(negotiation_error_code::approval_rejected));
}

TEST(contract_negotiator, rejection_aborts_the_session) {
  auto fixture = icnp::testing::session_fixture{};
  ASSERT_TRUE(fixture.declare().ok());
  fixture.disclose_standard();
  ASSERT_TRUE(fixture.propose(icnp::testing::make_standard_contract()).ok());

  EXPECT_EQ(fixture.negotiator()
                .reject(fixture.session(), "contract-9",
                        icnp::testing::make_agent("agent-b"), std::nullopt,
                        fixture.clock().now())
                .code,
            code_of(negotiation_error_code::contract_missing));

  ASSERT_TRUE(fixture.negotiator()
                  .reject(fixture.session(), "contract-1",
                          icnp::testing::make_agent("agent-b"),
                          std::string{"too broad"}, fixture.clock().now())
                  .ok());
  EXPECT_EQ(fixture.session().phase, session_phase_t::aborted);
  EXPECT_EQ(fixture.session().contract->status, contract_status_t::rejected);
  EXPECT_EQ(icnp::testing::count_events(fixture.audit(),
                                        audit_event_kind_t::contract_rejected),
            1u);
}

TEST(contract_negotiator, accepted_contract_cannot_be_rejected) {
  auto fixture = icnp::testing::session_fixture{};
  fixture.negotiate(icnp::testing::make_standard_contract());
  EXPECT_EQ(fixture.negotiator()
                .reject(fixture.session(), "contract-1",
                        icnp::testing::make_agent("agent-b"), std::nullopt,
                        fixture.clock().now())
                .code,
            code_of(negotiation_error_code::contract_already_accepted));
  EXPECT_EQ(fixture.session().phase, session_phase_t::contract);
}

TEST(contract_negotiator, signing_body_drops_signatures) {
  auto document = json_t{{"contract_id", "c"}, {"signatures", {{"a", 1}}}};
  auto body = icnp::negotiation::make_contract_signing_body(document);
  EXPECT_FALSE(body.contains("signatures"));
  EXPECT_EQ(body["contract_id"], "c");
}
