#include <icnp/registry/intent_registry.hpp>
#include <icnp/schema/encoding/json/encoder.hpp>

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

using namespace icnp::schema;

namespace icnp::registry {

namespace {

constexpr auto kCodespace = std::string_view{"icnp.intent"};

operation_result_t reject(const negotiation_error_code code,
                          std::string log,
                          std::string info = {}) {
  return make_failure(code, error_class_t::invalid_intent, std::move(log),
                      std::move(info), std::string{kCodespace});
}

}  // namespace

intent_registry::intent_registry(icnp::audit::audit_log& audit)
    : audit_(audit) {}

operation_result_t intent_registry::validate(const intent_t& intent) {
  if (intent.goal.empty()) {
    return reject(negotiation_error_code::intent_missing_goal,
                  "intent has no goal");
  }
  if (intent.requested_actions.empty()) {
    return reject(negotiation_error_code::intent_missing_actions,
                  "intent requests no actions");
  }
  const auto unnamed = std::find_if(
      std::begin(intent.requested_actions), std::end(intent.requested_actions),
      [](const requested_action_t& action) { return action.action.empty(); });
  if (unnamed != std::end(intent.requested_actions)) {
    return reject(negotiation_error_code::intent_missing_actions,
                  "requested action without a name");
  }
  if (intent.constraints.risk_tolerance == risk_tolerance_t::none &&
      !intent.constraints.human_approval_required) {
    return reject(negotiation_error_code::intent_risk_requires_approval,
                  "risk tolerance 'none' requires human approval");
  }
  return make_success();
}

operation_result_t intent_registry::record_intent(
    icnp::session::session_t& session,
    const actor_t& declarer,
    const intent_t& intent,
    std::optional<json_t> document,
    const timestamp_milliseconds_t now) {
  if (session.intent || session.phase != session_phase_t::intent) {
    return reject(negotiation_error_code::intent_already_recorded,
                  "session already has an intent", session.id);
  }
  if (declarer.id != session.initiator.id) {
    return reject(negotiation_error_code::invalid_actor,
                  "only the session initiator may declare the intent",
                  declarer.id);
  }
  auto result = validate(intent);
  if (!result.ok()) {
    return result;
  }

  if (!document) {
    auto encoder = encoding::encoder<encoding::json_encoder_tag>{};
    document = encoder.to_document(intent_declaration_t{.intent = intent});
  }
  session.intent = icnp::session::intent_record_t{
      .intent = intent,
      .document = std::move(*document),
      .declared_by = declarer.id,
      .recorded_at = now};

  spdlog::info("Session {}: intent recorded ({} requested action(s))",
               session.id, intent.requested_actions.size());
  auto actions = json_t::array();
  for (const auto& action : intent.requested_actions) {
    actions.push_back(action.action);
  }
  audit_.append(icnp::audit::make_audit_event(
      audit_event_kind_t::intent_recorded, session.id, {declarer.id}, now,
      json_t{{"goal", intent.goal},
             {"requested_actions", std::move(actions)},
             {"human_approval_required",
              intent.constraints.human_approval_required},
             {"risk_tolerance",
              std::string{to_string(intent.constraints.risk_tolerance)}}}));
  return make_success("intent recorded");
}

}  // namespace icnp::registry
