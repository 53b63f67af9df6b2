#include <icnp/common/time.hpp>
#include <icnp/execution/timeout.hpp>
#include <icnp/negotiation/contract_negotiator.hpp>
#include <icnp/registry/capability_ledger.hpp>
#include <icnp/schema/encoding/json/encoder.hpp>

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

using namespace icnp::schema;

namespace icnp::negotiation {

namespace {

constexpr auto kCodespace = std::string_view{"icnp.contract"};
constexpr auto kEnvelopeSignatureAlgorithm = std::string_view{"envelope"};

operation_result_t refuse(const negotiation_error_code code,
                          const error_class_t error,
                          std::string log,
                          std::string info = {},
                          const bool retryable = false) {
  return make_failure(code, error, std::move(log), std::move(info),
                      std::string{kCodespace}, retryable);
}

bool is_wildcard(const std::string_view scope) {
  return std::find(std::begin(kWildcardScopes), std::end(kWildcardScopes),
                   scope) != std::end(kWildcardScopes);
}

bool contains(const std::vector<std::string>& values,
              const std::string_view value) {
  return std::find(std::begin(values), std::end(values), value) !=
         std::end(values);
}

const capability_action_t* find_action(const capability_t& capability,
                                       const std::string_view action) {
  const auto it = std::find_if(
      std::begin(capability.actions), std::end(capability.actions),
      [&](const capability_action_t& offered) {
        return offered.action == action;
      });
  return it == std::end(capability.actions) ? nullptr : &*it;
}

// Contract constraints may restate intent constraints but never relax them.
operation_result_t check_not_loosened(const intent_constraints_t& intent,
                                      const json_t& constraints) {
  if (!constraints.is_object()) {
    return make_success();
  }
  if (const auto it = constraints.find("human_approval_required");
      it != constraints.end() && it->is_boolean() &&
      intent.human_approval_required && !it->get<bool>()) {
    return refuse(negotiation_error_code::constraints_loosened,
                  error_class_t::constraints_unsatisfiable,
                  "contract drops the required human approval",
                  "human_approval_required");
  }
  if (const auto it = constraints.find("external_side_effects_allowed");
      it != constraints.end() && it->is_boolean() &&
      !intent.external_side_effects_allowed && it->get<bool>()) {
    return refuse(negotiation_error_code::constraints_loosened,
                  error_class_t::constraints_unsatisfiable,
                  "contract allows side effects the intent forbids",
                  "external_side_effects_allowed");
  }
  if (const auto it = constraints.find("risk_tolerance");
      it != constraints.end() && it->is_string()) {
    const auto risk = try_from_string<risk_tolerance_t>(it->get<std::string>());
    if (risk && static_cast<uint8_t>(*risk) >
                    static_cast<uint8_t>(intent.risk_tolerance)) {
      return refuse(negotiation_error_code::constraints_loosened,
                    error_class_t::constraints_unsatisfiable,
                    "contract raises the intent's risk tolerance",
                    it->get<std::string>());
    }
  }
  return make_success();
}

// Invocation limits, when given, are positive counts. A zero limit would
// yield a token that can never be used.
operation_result_t check_invocation_limits(const contract_t& draft) {
  if (draft.constraints.is_object()) {
    for (const auto* key :
         {"max_invocations_per_actor", "max_invocations_total"}) {
      const auto it = draft.constraints.find(key);
      if (it == draft.constraints.end()) {
        continue;
      }
      const auto count = encoding::json::try_count_from_json(*it);
      if (!count || *count == 0) {
        return refuse(negotiation_error_code::invocation_limit_invalid,
                      error_class_t::constraints_unsatisfiable,
                      "invocation limit must be a positive count", key);
      }
    }
  }
  for (const auto& agreed : draft.agreed_actions) {
    if (agreed.max_invocations && *agreed.max_invocations == 0) {
      return refuse(negotiation_error_code::invocation_limit_invalid,
                    error_class_t::constraints_unsatisfiable,
                    "invocation limit must be a positive count",
                    agreed.action_id);
    }
  }
  return make_success();
}

bool is_superseded(const icnp::session::session_t& session,
                   const std::string_view contract_id) {
  return contains(session.superseded_contract_ids, contract_id);
}

}  // namespace

json_t make_contract_signing_body(const json_t& contract_document) {
  auto body = contract_document;
  if (body.is_object()) {
    body.erase("signatures");
  }
  return body;
}

contract_negotiator::contract_negotiator(
    icnp::audit::audit_log& audit,
    icnp::session::session_store& sessions,
    const icnp::config::engine_options_t& options,
    const icnp::execution::collaborators_t& collaborators)
    : audit_(audit),
      sessions_(sessions),
      options_(options),
      collaborators_(collaborators) {}

bool contract_negotiator::forbids(const contract_t& contract,
                                  const std::string_view action,
                                  const std::string_view scope) {
  return std::any_of(
      std::begin(contract.forbidden_actions),
      std::end(contract.forbidden_actions),
      [&](const forbidden_action_t& forbidden) {
        if (forbidden.action != action) {
          return false;
        }
        return !forbidden.scope || is_wildcard(*forbidden.scope) ||
               *forbidden.scope == scope;
      });
}

std::vector<const agreed_action_t*> contract_negotiator::effective_actions(
    const contract_t& contract) {
  auto result = std::vector<const agreed_action_t*>{};
  for (const auto& agreed : contract.agreed_actions) {
    if (!forbids(contract, agreed.action, agreed.scope)) {
      result.push_back(&agreed);
    }
  }
  return result;
}

const agreed_action_t* contract_negotiator::authorize(
    const contract_t& contract,
    const std::string_view action,
    const std::string_view executor_id,
    const std::optional<std::string>& scope) {
  if (scope && forbids(contract, action, *scope)) {
    return nullptr;
  }
  for (const auto* agreed : effective_actions(contract)) {
    if (agreed->action != action || agreed->executor_id != executor_id) {
      continue;
    }
    if (scope && !agreed->scope.empty() && agreed->scope != *scope) {
      continue;
    }
    return agreed;
  }
  return nullptr;
}

bool contract_negotiator::is_authorized(
    const contract_t& contract,
    const std::string_view action,
    const std::string_view executor_id,
    const std::optional<std::string>& scope) {
  return authorize(contract, action, executor_id, scope) != nullptr;
}

std::vector<std::string> contract_negotiator::required_signers(
    const contract_t& contract) {
  auto result = std::vector<std::string>{};
  for (const auto& agreed : contract.agreed_actions) {
    result.push_back(agreed.executor_id);
  }
  std::sort(std::begin(result), std::end(result));
  result.erase(std::unique(std::begin(result), std::end(result)),
               std::end(result));
  return result;
}

operation_result_t contract_negotiator::check_approval_gate(
    const icnp::session::session_t& session,
    const contract_t& contract) {
  auto required = session.intent &&
                  session.intent->intent.constraints.human_approval_required;
  for (const auto& agreed : contract.agreed_actions) {
    if (required) {
      break;
    }
    const auto* disclosed =
        icnp::registry::capability_ledger::lookup(session, agreed.capability_id);
    if (!disclosed) {
      continue;
    }
    const auto* offered = find_action(disclosed->capability, agreed.action);
    required = offered && offered->requires_approval;
  }
  if (!required) {
    return make_success();
  }

  auto approved = false;
  for (const auto& approval : contract.approvals) {
    if (approval.decision == approval_decision_t::reject) {
      return refuse(negotiation_error_code::approval_rejected,
                    error_class_t::unauthorised_action,
                    "contract approval was rejected", approval.approver.id);
    }
    approved = true;
  }
  if (!approved) {
    return refuse(negotiation_error_code::approval_missing,
                  error_class_t::unauthorised_action,
                  "contract requires an approval", contract.contract_id);
  }
  return make_success();
}

operation_result_t contract_negotiator::validate_draft(
    const icnp::session::session_t& session,
    const contract_t& draft) const {
  if (!session.intent) {
    return refuse(negotiation_error_code::intent_not_recorded,
                  error_class_t::invalid_intent, "no intent has been recorded",
                  session.id);
  }
  if (draft.session_id != session.id) {
    return refuse(negotiation_error_code::contract_session_mismatch,
                  error_class_t::constraints_unsatisfiable,
                  "contract names another session", draft.session_id);
  }
  if (draft.contract_id.empty() || draft.agreed_actions.empty()) {
    return refuse(negotiation_error_code::contract_empty,
                  error_class_t::constraints_unsatisfiable,
                  "contract needs an id and at least one agreed action",
                  draft.contract_id);
  }

  const auto& constraints = session.intent->intent.constraints;
  for (const auto& agreed : draft.agreed_actions) {
    const auto subject = fmt::format("{}/{}", agreed.capability_id,
                                     agreed.action);
    const auto* disclosed =
        icnp::registry::capability_ledger::lookup(session, agreed.capability_id);
    if (!disclosed) {
      return refuse(negotiation_error_code::capability_missing,
                    error_class_t::capability_mismatch,
                    "agreed action references an undisclosed capability",
                    agreed.capability_id);
    }
    if (disclosed->participant_id != agreed.executor_id) {
      return refuse(negotiation_error_code::capability_owner_mismatch,
                    error_class_t::capability_mismatch,
                    "executor does not own the capability",
                    fmt::format("{} is owned by {}", agreed.capability_id,
                                disclosed->participant_id));
    }
    const auto* offered = find_action(disclosed->capability, agreed.action);
    if (!offered) {
      return refuse(negotiation_error_code::capability_action_missing,
                    error_class_t::capability_mismatch,
                    "capability does not offer the agreed action", subject);
    }
    if (!agreed.scope.empty() && !contains(offered->scopes, agreed.scope)) {
      return refuse(negotiation_error_code::capability_scope_missing,
                    error_class_t::capability_mismatch,
                    "capability does not offer the agreed scope",
                    fmt::format("{}@{}", subject, agreed.scope));
    }
    if (offered->effects != kNoEffects &&
        !constraints.external_side_effects_allowed) {
      return refuse(negotiation_error_code::side_effects_forbidden,
                    error_class_t::constraints_unsatisfiable,
                    "intent forbids external side effects", subject);
    }
  }

  auto result = check_not_loosened(constraints, draft.constraints);
  if (!result.ok()) {
    return result;
  }
  result = check_invocation_limits(draft);
  if (!result.ok()) {
    return result;
  }

  if (options_.require_full_coverage) {
    const auto effective = effective_actions(draft);
    for (const auto& requested : session.intent->intent.requested_actions) {
      const auto covered = std::any_of(
          std::begin(effective), std::end(effective),
          [&](const agreed_action_t* agreed) {
            return agreed->action == requested.action;
          });
      if (!covered) {
        return refuse(negotiation_error_code::requested_action_uncovered,
                      error_class_t::capability_mismatch,
                      "requested action is not covered by the contract",
                      requested.action);
      }
    }
  }
  return make_success();
}

void contract_negotiator::install(icnp::session::session_t& session,
                                  const actor_t& proposer,
                                  const contract_t& draft,
                                  std::optional<json_t> document,
                                  const timestamp_milliseconds_t now) {
  auto revision = uint32_t{0};
  if (session.contract) {
    session.contract->status = contract_status_t::superseded;
    session.superseded_contract_ids.push_back(
        session.contract->contract.contract_id);
    revision = session.contract->revision + 1;
  }
  if (!document) {
    auto encoder = encoding::encoder<encoding::json_encoder_tag>{};
    document = encoder.to_document(draft);
  }

  auto contract = draft;
  // Signatures are only collected through acceptance.
  contract.signatures.clear();
  session.contract = icnp::session::contract_record_t{
      .contract = std::move(contract),
      .document = std::move(*document),
      .proposer_id = proposer.id,
      .status = contract_status_t::proposed,
      .revision = revision,
      .proposed_at = now,
      .accepted_at = std::nullopt};
}

operation_result_t contract_negotiator::propose(
    icnp::session::session_t& session,
    const actor_t& proposer,
    const contract_t& draft,
    std::optional<json_t> document,
    const timestamp_milliseconds_t now) {
  if (session.phase != session_phase_t::capability &&
      session.phase != session_phase_t::contract) {
    return refuse(negotiation_error_code::contract_phase_closed,
                  error_class_t::constraints_unsatisfiable,
                  "contracts are proposed in the capability or contract phase",
                  std::string{to_string(session.phase)});
  }
  if (proposer.id != session.initiator.id) {
    return refuse(negotiation_error_code::proposer_not_initiator,
                  error_class_t::unauthorised_action,
                  "only the session initiator may propose a contract",
                  proposer.id);
  }
  if (session.contract &&
      session.contract->status == contract_status_t::accepted) {
    return refuse(negotiation_error_code::contract_already_accepted,
                  error_class_t::constraints_unsatisfiable,
                  "session contract is already accepted",
                  session.contract->contract.contract_id);
  }
  if ((session.contract &&
       session.contract->contract.contract_id == draft.contract_id) ||
      is_superseded(session, draft.contract_id)) {
    return refuse(negotiation_error_code::contract_id_reused,
                  error_class_t::constraints_unsatisfiable,
                  "contract id was already proposed", draft.contract_id);
  }
  auto result = validate_draft(session, draft);
  if (!result.ok()) {
    return result;
  }

  if (session.phase == session_phase_t::capability) {
    result = sessions_.transition(session, session_phase_t::contract, now);
    if (!result.ok()) {
      return result;
    }
  }
  const auto replaced = session.contract
                            ? session.contract->contract.contract_id
                            : std::string{};
  install(session, proposer, draft, std::move(document), now);

  spdlog::info("Session {}: contract {} proposed by {}", session.id,
               draft.contract_id, proposer.id);
  auto details = json_t{{"contract_id", draft.contract_id},
                        {"agreed_actions", draft.agreed_actions.size()},
                        {"forbidden_actions", draft.forbidden_actions.size()},
                        {"required_signers", required_signers(draft)}};
  if (!replaced.empty()) {
    details["supersedes"] = replaced;
  }
  audit_.append(icnp::audit::make_audit_event(
      audit_event_kind_t::contract_proposed, session.id,
      {draft.contract_id, proposer.id}, now, std::move(details)));
  return make_success("contract proposed");
}

operation_result_t contract_negotiator::counter_propose(
    icnp::session::session_t& session,
    const actor_t& proposer,
    const contract_t& draft,
    std::optional<json_t> document,
    const timestamp_milliseconds_t now) {
  if (session.phase != session_phase_t::contract || !session.contract) {
    return refuse(negotiation_error_code::contract_phase_closed,
                  error_class_t::constraints_unsatisfiable,
                  "counter-proposals need a pending contract",
                  std::string{to_string(session.phase)});
  }
  if (session.contract->status == contract_status_t::accepted) {
    return refuse(negotiation_error_code::contract_already_accepted,
                  error_class_t::constraints_unsatisfiable,
                  "session contract is already accepted",
                  session.contract->contract.contract_id);
  }
  if (!session.participants.contains(proposer.id)) {
    return refuse(negotiation_error_code::signer_not_party,
                  error_class_t::unauthorised_action,
                  "counter-proposer is not a session participant",
                  proposer.id);
  }
  if (session.contract->contract.contract_id == draft.contract_id ||
      is_superseded(session, draft.contract_id)) {
    return refuse(negotiation_error_code::contract_id_reused,
                  error_class_t::constraints_unsatisfiable,
                  "contract id was already proposed", draft.contract_id);
  }
  auto result = validate_draft(session, draft);
  if (!result.ok()) {
    return result;
  }

  const auto replaced = session.contract->contract.contract_id;
  install(session, proposer, draft, std::move(document), now);

  spdlog::info("Session {}: {} counter-proposed {} replacing {}", session.id,
               proposer.id, draft.contract_id, replaced);
  audit_.append(icnp::audit::make_audit_event(
      audit_event_kind_t::contract_counterproposed, session.id,
      {draft.contract_id, replaced, proposer.id}, now,
      json_t{{"contract_id", draft.contract_id},
             {"supersedes", replaced},
             {"revision", session.contract->revision}}));
  return make_success("contract counter-proposed");
}

operation_result_t contract_negotiator::verify_signature(
    const icnp::session::contract_record_t& record,
    const signature_t& signature) const {
  const auto& signer = collaborators_.signer;
  if (!signer.verify || signer.algorithm != signature.alg) {
    return refuse(negotiation_error_code::signature_invalid,
                  error_class_t::unauthorised_action,
                  "no verifier for the signature algorithm", signature.alg);
  }
  const auto decoded = try_from_base64(signature.value);
  if (!decoded) {
    return refuse(negotiation_error_code::signature_invalid,
                  error_class_t::unauthorised_action,
                  "signature value is not base64", signature.signed_by);
  }

  auto canonicalizer = collaborators_.canonicalizer;
  auto verify = signer.verify;
  auto body = make_contract_signing_body(record.document);
  auto value = *decoded;
  auto key_id = signature.key_id;
  const auto verified = icnp::execution::call_with_timeout<bool>(
      collaborators_.workers.get(), "contract-signature-verify",
      options_.collaborator_timeout_ms,
      [canonicalizer, verify, body = std::move(body), value = std::move(value),
       key_id = std::move(key_id)]() {
        const auto bytes = canonicalizer ? canonicalizer(body) : std::nullopt;
        if (!bytes) {
          throw std::runtime_error{"contract has no canonical form"};
        }
        return verify(make_bytes_view(*bytes), make_bytes_view(value), key_id);
      });
  if (!verified) {
    return refuse(negotiation_error_code::collaborator_failure,
                  error_class_t::internal_error,
                  "contract signature could not be verified",
                  signature.signed_by, true);
  }
  if (!*verified) {
    return refuse(negotiation_error_code::signature_invalid,
                  error_class_t::unauthorised_action,
                  "contract signature does not verify", signature.signed_by);
  }
  return make_success();
}

operation_result_t contract_negotiator::accept(
    icnp::session::session_t& session,
    const std::string_view contract_id,
    const actor_t& signer,
    const std::optional<signature_t>& signature,
    const timestamp_milliseconds_t now) {
  if (session.phase != session_phase_t::contract || !session.contract) {
    return refuse(session.contract
                      ? negotiation_error_code::contract_already_accepted
                      : negotiation_error_code::contract_phase_closed,
                  error_class_t::constraints_unsatisfiable,
                  "no contract is open for acceptance",
                  std::string{to_string(session.phase)});
  }
  if (is_superseded(session, contract_id)) {
    return refuse(negotiation_error_code::contract_superseded,
                  error_class_t::constraints_unsatisfiable,
                  "contract was superseded", std::string{contract_id});
  }
  auto& record = *session.contract;
  if (record.contract.contract_id != contract_id) {
    return refuse(negotiation_error_code::contract_missing,
                  error_class_t::constraints_unsatisfiable,
                  "unknown contract id", std::string{contract_id});
  }
  if (record.status == contract_status_t::accepted) {
    return refuse(negotiation_error_code::contract_already_accepted,
                  error_class_t::constraints_unsatisfiable,
                  "contract is already accepted", std::string{contract_id});
  }

  const auto signers = required_signers(record.contract);
  if (!contains(signers, signer.id) && signer.id != record.proposer_id) {
    return refuse(negotiation_error_code::signer_not_party,
                  error_class_t::unauthorised_action,
                  "signer is neither an executor nor the proposer", signer.id);
  }

  auto recorded = signature_t{};
  if (signature) {
    if (signature->signed_by != signer.id) {
      return refuse(negotiation_error_code::signature_invalid,
                    error_class_t::unauthorised_action,
                    "signature was made by another party",
                    signature->signed_by);
    }
    auto result = verify_signature(record, *signature);
    if (!result.ok()) {
      return result;
    }
    recorded = *signature;
  } else {
    recorded = signature_t{.alg = std::string{kEnvelopeSignatureAlgorithm},
                           .value = {},
                           .key_id = {},
                           .signed_by = signer.id,
                           .signed_at = icnp::common::format_rfc3339(now)};
  }

  const auto complete = std::all_of(
      std::begin(signers), std::end(signers), [&](const std::string& id) {
        return id == signer.id || record.contract.signatures.contains(id);
      });
  if (complete) {
    auto result = check_approval_gate(session, record.contract);
    if (!result.ok()) {
      spdlog::warn("Session {}: contract {} held at the approval gate: {}",
                   session.id, contract_id, result.log);
      return result;
    }
  }

  record.contract.signatures.insert_or_assign(signer.id, std::move(recorded));
  session.participants.try_emplace(signer.id, signer);
  audit_.append(icnp::audit::make_audit_event(
      audit_event_kind_t::contract_signed, session.id,
      {std::string{contract_id}, signer.id}, now,
      json_t{{"contract_id", std::string{contract_id}},
             {"signer", signer.id},
             {"alg", record.contract.signatures.at(signer.id).alg}}));

  if (!complete) {
    spdlog::info("Session {}: {} signed contract {} ({}/{})", session.id,
                 signer.id, contract_id, record.contract.signatures.size(),
                 signers.size());
    return make_success("signature recorded");
  }

  record.status = contract_status_t::accepted;
  record.accepted_at = now;
  spdlog::info("Session {}: contract {} accepted", session.id, contract_id);
  audit_.append(icnp::audit::make_audit_event(
      audit_event_kind_t::contract_accepted, session.id,
      {std::string{contract_id}}, now,
      json_t{{"contract_id", std::string{contract_id}},
             {"signers", signers}}));
  return make_success("contract accepted");
}

operation_result_t contract_negotiator::reject(
    icnp::session::session_t& session,
    const std::string_view contract_id,
    const actor_t& rejector,
    const std::optional<std::string>& reason,
    const timestamp_milliseconds_t now) {
  if (session.phase != session_phase_t::contract || !session.contract) {
    return refuse(negotiation_error_code::contract_phase_closed,
                  error_class_t::constraints_unsatisfiable,
                  "no contract is open for rejection",
                  std::string{to_string(session.phase)});
  }
  if (is_superseded(session, contract_id)) {
    return refuse(negotiation_error_code::contract_superseded,
                  error_class_t::constraints_unsatisfiable,
                  "contract was superseded",
                  std::string{contract_id});
  }
  auto& record = *session.contract;
  if (record.contract.contract_id != contract_id) {
    return refuse(negotiation_error_code::contract_missing,
                  error_class_t::constraints_unsatisfiable,
                  "unknown contract id", std::string{contract_id});
  }
  if (record.status == contract_status_t::accepted) {
    return refuse(negotiation_error_code::contract_already_accepted,
                  error_class_t::constraints_unsatisfiable,
                  "contract is already accepted",
                  std::string{contract_id});
  }
  const auto signers = required_signers(record.contract);
  if (!contains(signers, rejector.id) && rejector.id != record.proposer_id &&
      !session.participants.contains(rejector.id)) {
    return refuse(negotiation_error_code::signer_not_party,
                  error_class_t::unauthorised_action,
                  "rejector is not a session participant",
                  rejector.id);
  }

  record.status = contract_status_t::rejected;
  spdlog::info("Session {}: contract {} rejected by {}", session.id,
               contract_id, rejector.id);
  auto details = json_t{{"contract_id", std::string{contract_id}},
                        {"rejector", rejector.id}};
  if (reason) {
    details["reason"] = *reason;
  }
  audit_.append(icnp::audit::make_audit_event(
      audit_event_kind_t::contract_rejected, session.id,
      {std::string{contract_id}, rejector.id}, now, std::move(details),
      audit_severity_t::warning));
  return sessions_.transition(session, session_phase_t::aborted, now);
}

}  // namespace icnp::negotiation
