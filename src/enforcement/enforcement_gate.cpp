#include <icnp/enforcement/enforcement_gate.hpp>
#include <icnp/execution/timeout.hpp>
#include <icnp/negotiation/contract_negotiator.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

#include <spdlog/spdlog.h>

using namespace icnp::schema;

namespace icnp::enforcement {

namespace {

constexpr auto kCodespace = std::string_view{"icnp.enforcement"};

operation_result_t refuse(const negotiation_error_code code,
                          const error_class_t error,
                          std::string log,
                          std::string info = {},
                          const bool retryable = false) {
  return make_failure(code, error, std::move(log), std::move(info),
                      std::string{kCodespace}, retryable);
}

operation_result_t unauthorised(const negotiation_error_code code,
                                std::string log,
                                std::string info = {}) {
  return refuse(code, error_class_t::unauthorised_action, std::move(log),
                std::move(info));
}

operation_result_t token_invalid(const negotiation_error_code code,
                                 std::string log,
                                 std::string info = {}) {
  return refuse(code, error_class_t::token_invalid, std::move(log),
                std::move(info));
}

enforcement_t enforcement_of(const icnp::session::session_t& session) {
  return session.contract ? session.contract->contract.enforcement
                          : enforcement_t{};
}

audit_severity_t violation_severity(const enforcement_mode_t mode) {
  switch (mode) {
    case enforcement_mode_t::permissive:
      return audit_severity_t::warning;
    case enforcement_mode_t::audit_only:
      return audit_severity_t::info;
    case enforcement_mode_t::strict:
    default:
      return audit_severity_t::error;
  }
}

// Distinguishes an agreement cancelled by a forbidden entry from no agreement.
negotiation_error_code unauthorised_reason(
    const contract_t& contract,
    const execution_request_t& request) {
  using icnp::negotiation::contract_negotiator;
  if (request.scope &&
      contract_negotiator::forbids(contract, request.action, *request.scope)) {
    return negotiation_error_code::action_forbidden;
  }
  const auto agreed = std::any_of(
      std::begin(contract.agreed_actions), std::end(contract.agreed_actions),
      [&](const agreed_action_t& candidate) {
        return candidate.action == request.action &&
               candidate.executor_id == request.executor.id;
      });
  return agreed ? negotiation_error_code::action_forbidden
                : negotiation_error_code::action_not_agreed;
}

json_t violation_details(const execution_request_t& request,
                         const operation_result_t& result,
                         const enforcement_t& enforcement) {
  auto details = json_t{{"invocation_id", request.invocation_id},
                        {"token_id", request.token_id},
                        {"contract_id", request.contract_id},
                        {"action", request.action},
                        {"executor", request.executor.id},
                        {"code", result.code},
                        {"error", std::string{to_string(result.error)}},
                        {"reason", result.log},
                        {"mode", std::string{to_string(enforcement.mode)}}};
  if (request.scope) {
    details["scope"] = *request.scope;
  }
  if (request.nonce) {
    details["nonce"] = *request.nonce;
  }
  return details;
}

}  // namespace

enforcement_gate::enforcement_gate(
    icnp::audit::audit_log& audit,
    icnp::session::session_store& sessions,
    icnp::token::token_issuer& issuer,
    const icnp::config::engine_options_t& options,
    const icnp::execution::collaborators_t& collaborators)
    : audit_(audit),
      sessions_(sessions),
      issuer_(issuer),
      options_(options),
      collaborators_(collaborators) {}

operation_result_t enforcement_gate::check(
    icnp::session::session_t& session,
    const execution_request_t& request,
    const timestamp_milliseconds_t now) {
  if (request.nonce && session.seen_nonces.contains(*request.nonce)) {
    return unauthorised(negotiation_error_code::nonce_replayed,
                        "nonce was already used", *request.nonce);
  }

  auto issued = icnp::token::token_issuer::resolve(session, request.token_id);
  if (!issued) {
    return token_invalid(negotiation_error_code::token_missing,
                         "token is unknown to this session", request.token_id);
  }
  auto result = issuer_.check(*issued, now);
  if (!result.ok()) {
    return result;
  }
  if (issued->token.contract_id != request.contract_id) {
    return token_invalid(negotiation_error_code::token_contract_mismatch,
                         "token was issued for another contract",
                         request.contract_id);
  }
  if (issued->token.session_id != session.id) {
    return token_invalid(negotiation_error_code::token_session_mismatch,
                         "token was issued for another session",
                         issued->token.session_id);
  }
  if (!session.contract ||
      session.contract->status != contract_status_t::accepted) {
    return token_invalid(negotiation_error_code::contract_not_accepted,
                         "session has no accepted contract", session.id);
  }

  const auto& contract = session.contract->contract;
  const auto* agreed = icnp::negotiation::contract_negotiator::authorize(
      contract, request.action, request.executor.id, request.scope);
  if (!agreed) {
    return unauthorised(unauthorised_reason(contract, request),
                        "action is not authorized for this executor",
                        request.executor.id + ":" + request.action);
  }
  const auto& audience = issued->token.audience;
  const auto member = std::any_of(
      std::begin(audience), std::end(audience),
      [&](const actor_t& actor) { return actor.id == request.executor.id; });
  if (!member) {
    return unauthorised(negotiation_error_code::executor_not_in_audience,
                        "executor is not in the token audience",
                        request.executor.id);
  }

  return issuer_.try_consume(session, *issued, *agreed, request.executor.id);
}

void enforcement_gate::roll_back(icnp::session::session_t& session,
                                 const execution_request_t& request,
                                 execution_decision_t& decision,
                                 const timestamp_milliseconds_t now) {
  auto status = std::optional<icnp::execution::rollback_status_t>{};
  if (collaborators_.rollback) {
    auto rollback = collaborators_.rollback;
    auto invocation_id = request.invocation_id;
    status = icnp::execution::call_with_timeout<
        icnp::execution::rollback_status_t>(
        collaborators_.workers.get(), "rollback",
        options_.collaborator_timeout_ms,
        [rollback, invocation_id]() { return rollback(invocation_id); });
  } else {
    spdlog::warn("Session {}: rollback required but no executor configured",
                 session.id);
  }

  decision.rolled_back =
      status && *status == icnp::execution::rollback_status_t::ok;
  const auto outcome = !status ? "unavailable"
                       : decision.rolled_back ? "ok"
                                              : "error";
  spdlog::info("Session {}: rollback of {} finished: {}", session.id,
               request.invocation_id, outcome);
  audit_.append(icnp::audit::make_audit_event(
      audit_event_kind_t::rollback, session.id, {request.invocation_id}, now,
      json_t{{"invocation_id", request.invocation_id}, {"status", outcome}},
      decision.rolled_back ? audit_severity_t::info
                           : audit_severity_t::error));
}

void enforcement_gate::deny(icnp::session::session_t& session,
                            const execution_request_t& request,
                            execution_decision_t& decision,
                            const timestamp_milliseconds_t now) {
  const auto enforcement = enforcement_of(session);
  decision.allowed = false;
  decision.violation = true;

  spdlog::warn("Session {}: invocation {} denied: {}", session.id,
               request.invocation_id, decision.result.log);
  audit_.append(icnp::audit::make_audit_event(
      audit_event_kind_t::violation, session.id,
      {request.invocation_id, request.executor.id}, now,
      violation_details(request, decision.result, enforcement),
      violation_severity(enforcement.mode)));

  if (enforcement.mode != enforcement_mode_t::strict) {
    return;
  }
  if (enforcement.violation_action == violation_action_t::abort_and_rollback ||
      enforcement.rollback_required) {
    roll_back(session, request, decision, now);
  }
  if (enforcement.violation_action == violation_action_t::abort ||
      enforcement.violation_action == violation_action_t::abort_and_rollback) {
    decision.session_aborted =
        sessions_.transition(session, session_phase_t::aborted, now).ok();
  }
}

void enforcement_gate::start(icnp::session::session_t& session,
                             const execution_request_t& request,
                             execution_decision_t& decision,
                             const timestamp_milliseconds_t now) {
  if (session.phase == session_phase_t::token) {
    auto result = sessions_.transition(session, session_phase_t::execution, now);
    if (!result.ok()) {
      decision.allowed = false;
      decision.result = result;
      return;
    }
  }
  auto& record = session.invocations.at(request.invocation_id);
  record.state = invocation_state_t::executing;
  decision.allowed = true;

  spdlog::info("Session {}: invocation {} of {} by {} started", session.id,
               request.invocation_id, request.action, request.executor.id);
  audit_.append(icnp::audit::make_audit_event(
      audit_event_kind_t::execution_started, session.id,
      {request.invocation_id, request.executor.id}, now,
      json_t{{"invocation_id", request.invocation_id},
             {"token_id", request.token_id},
             {"action", request.action},
             {"executor", request.executor.id},
             {"violation", record.violation}}));
}

execution_decision_t enforcement_gate::evaluate(
    icnp::session::session_t& session,
    const execution_request_t& request,
    const timestamp_milliseconds_t now) {
  auto decision = execution_decision_t{};
  decision.invocation_id = request.invocation_id;

  if (session.phase != session_phase_t::token &&
      session.phase != session_phase_t::execution) {
    decision.result = token_invalid(
        negotiation_error_code::session_not_executing,
        "session is not executing", std::string{to_string(session.phase)});
    decision.violation = true;
    audit_.append(icnp::audit::make_audit_event(
        audit_event_kind_t::violation, session.id,
        {request.invocation_id, request.executor.id}, now,
        violation_details(request, decision.result, enforcement_of(session)),
        audit_severity_t::error));
    return decision;
  }

  // A replayed invocation never runs twice, whatever the mode.
  if (session.invocations.contains(request.invocation_id)) {
    decision.result =
        unauthorised(negotiation_error_code::invocation_replayed,
                     "invocation id was already used", request.invocation_id);
    deny(session, request, decision, now);
    return decision;
  }

  auto& record = session.invocations[request.invocation_id];
  record = icnp::session::invocation_record_t{
      .invocation_id = request.invocation_id,
      .token_id = request.token_id,
      .executor_id = request.executor.id,
      .action = request.action,
      .scope = request.scope,
      .state = invocation_state_t::received,
      .violation = false,
      .received_at = now,
      .finished_at = std::nullopt};

  auto result = check(session, request, now);
  if (request.nonce) {
    session.seen_nonces.insert(*request.nonce);
  }
  if (result.ok()) {
    record.state = invocation_state_t::validated;
    decision.result = make_success("invocation authorized");
    start(session, request, decision, now);
    return decision;
  }

  decision.result = std::move(result);
  const auto mode = enforcement_of(session).mode;
  if (mode == enforcement_mode_t::strict) {
    record.state = invocation_state_t::denied;
    record.finished_at = now;
    deny(session, request, decision, now);
    return decision;
  }

  // Permissive and audit-only enforcement record the violation and proceed.
  record.violation = true;
  record.state = invocation_state_t::validated;
  decision.violation = true;
  spdlog::info("Session {}: invocation {} proceeds despite violation ({})",
               session.id, request.invocation_id, to_string(mode));
  audit_.append(icnp::audit::make_audit_event(
      audit_event_kind_t::violation, session.id,
      {request.invocation_id, request.executor.id}, now,
      violation_details(request, decision.result, enforcement_of(session)),
      violation_severity(mode)));
  start(session, request, decision, now);
  return decision;
}

operation_result_t enforcement_gate::complete(
    icnp::session::session_t& session,
    const actor_t& reporter,
    const execution_result_t& result,
    const timestamp_milliseconds_t now) {
  const auto it = session.invocations.find(result.invocation_id);
  if (it == session.invocations.end()) {
    return unauthorised(negotiation_error_code::invocation_missing,
                        "unknown invocation", result.invocation_id);
  }
  auto& record = it->second;
  if (reporter.id != record.executor_id) {
    return unauthorised(negotiation_error_code::invalid_actor,
                        "only the executor may report the outcome",
                        reporter.id);
  }
  if (result.token_id != record.token_id ||
      (session.contract &&
       result.contract_id != session.contract->contract.contract_id)) {
    return token_invalid(negotiation_error_code::token_contract_mismatch,
                         "result names another token or contract",
                         result.invocation_id);
  }
  if (record.state != invocation_state_t::executing) {
    return unauthorised(negotiation_error_code::invocation_not_executing,
                        "invocation is not executing",
                        std::string{to_string(record.state)});
  }

  const auto success = result.status == execution_status_t::success;
  record.state =
      success ? invocation_state_t::completed : invocation_state_t::failed;
  record.finished_at = now;

  spdlog::info("Session {}: invocation {} {}", session.id,
               result.invocation_id, to_string(record.state));
  auto details = json_t{{"invocation_id", result.invocation_id},
                        {"status", std::string{to_string(result.status)}},
                        {"violation", record.violation}};
  if (result.started_at) {
    details["started_at"] = *result.started_at;
  }
  if (result.ended_at) {
    details["ended_at"] = *result.ended_at;
  }
  audit_.append(icnp::audit::make_audit_event(
      success ? audit_event_kind_t::execution_completed
              : audit_event_kind_t::execution_failed,
      session.id, {result.invocation_id, reporter.id}, now, std::move(details),
      success ? audit_severity_t::info : audit_severity_t::warning));
  return make_success(std::string{to_string(record.state)});
}

}  // namespace icnp::enforcement
