#include <icnp/common/time.hpp>
#include <icnp/common/uuid.hpp>
#include <icnp/execution/timeout.hpp>
#include <icnp/negotiation/contract_negotiator.hpp>
#include <icnp/schema/encoding/json/encoder.hpp>
#include <icnp/token/binding.hpp>
#include <icnp/token/token_issuer.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

using namespace icnp::schema;

namespace icnp::token {

namespace {

constexpr auto kCodespace = std::string_view{"icnp.token"};

operation_result_t refuse(const negotiation_error_code code,
                          const error_class_t error,
                          std::string log,
                          std::string info = {},
                          const bool retryable = false) {
  return make_failure(code, error, std::move(log), std::move(info),
                      std::string{kCodespace}, retryable);
}

operation_result_t invalid(const negotiation_error_code code,
                           std::string log,
                           std::string info = {}) {
  return refuse(code, error_class_t::token_invalid, std::move(log),
                std::move(info));
}

std::optional<uint32_t> read_limit(const json_t& constraints,
                                   const char* key) {
  if (!constraints.is_object()) {
    return std::nullopt;
  }
  const auto it = constraints.find(key);
  if (it == constraints.end()) {
    return std::nullopt;
  }
  return encoding::json::try_count_from_json(*it);
}

std::string action_key(const agreed_action_t& agreed) {
  if (!agreed.action_id.empty()) {
    return agreed.action_id;
  }
  return fmt::format("{}/{}/{}@{}", agreed.capability_id, agreed.executor_id,
                     agreed.action, agreed.scope);
}

bool same_binding(const binding_hash_t& declared,
                  const std::optional<binding_hash_t>& recomputed) {
  return recomputed && declared.alg == recomputed->alg &&
         declared.value == recomputed->value;
}

}  // namespace

token_issuer::token_issuer(icnp::audit::audit_log& audit,
                           icnp::session::session_store& sessions,
                           const icnp::config::engine_options_t& options,
                           const icnp::execution::collaborators_t& collaborators)
    : audit_(audit),
      sessions_(sessions),
      options_(options),
      collaborators_(collaborators) {}

std::optional<bytes_t> token_issuer::canonical_bytes(
    const std::string& name,
    const json_t& document) const {
  auto canonicalizer = collaborators_.canonicalizer;
  if (!canonicalizer) {
    spdlog::error("No canonicalizer configured for '{}'", name);
    return std::nullopt;
  }
  return icnp::execution::call_with_timeout<bytes_t>(
      collaborators_.workers.get(), name,
      options_.collaborator_timeout_ms,
      [canonicalizer, document]() {
        auto bytes = canonicalizer(document);
        if (!bytes) {
          throw std::runtime_error{"document has no canonical form"};
        }
        return std::move(*bytes);
      });
}

std::optional<bool> token_issuer::verify(const bytes_t& body,
                                         const signature_t& signature) const {
  const auto& signer = collaborators_.signer;
  if (!signer.verify || signer.algorithm != signature.alg) {
    return false;
  }
  auto value = try_from_base64(signature.value);
  if (!value) {
    return false;
  }
  auto verify = signer.verify;
  auto key_id = signature.key_id;
  return icnp::execution::call_with_timeout<bool>(
      collaborators_.workers.get(), "token-signature-verify",
      options_.collaborator_timeout_ms,
      [verify, body, value = std::move(*value), key_id = std::move(key_id)]() {
        return verify(make_bytes_view(body), make_bytes_view(value), key_id);
      });
}

operation_result_t token_issuer::issue(icnp::session::session_t& session,
                                       const actor_t& issuer,
                                       const timestamp_milliseconds_t now,
                                       execution_token_t& out) {
  if (session.contract) {
    auto gate = icnp::negotiation::contract_negotiator::check_approval_gate(
        session, session.contract->contract);
    if (!gate.ok()) {
      spdlog::warn("Session {}: token refused at the approval gate: {}",
                   session.id, gate.log);
      return gate;
    }
  }
  if (session.phase != session_phase_t::contract) {
    return invalid(session.token ? negotiation_error_code::token_already_issued
                                 : negotiation_error_code::contract_not_accepted,
                   "tokens are issued from the contract phase",
                   std::string{to_string(session.phase)});
  }
  if (!session.contract ||
      session.contract->status != contract_status_t::accepted) {
    return invalid(negotiation_error_code::contract_not_accepted,
                   "session contract is not accepted", session.id);
  }
  const auto& contract = session.contract->contract;

  auto documents = make_binding_documents(session);
  if (!documents) {
    return invalid(negotiation_error_code::contract_not_accepted,
                   "session has nothing to bind", session.id);
  }
  const auto algorithm = options_.binding_hash_algorithm;
  auto canonicalizer = collaborators_.canonicalizer;
  const auto binding = icnp::execution::call_with_timeout<token_binding_t>(
      collaborators_.workers.get(), "token-binding-hash",
      options_.collaborator_timeout_ms,
      [documents = std::move(*documents), algorithm, canonicalizer]() {
        auto error = std::string{};
        auto result = compute_binding(documents, algorithm, canonicalizer,
                                      error);
        if (!result) {
          throw std::runtime_error{error};
        }
        return std::move(*result);
      });
  if (!binding) {
    return refuse(negotiation_error_code::canonicalization_failed,
                  error_class_t::internal_error,
                  "binding hashes could not be computed", session.id, true);
  }

  auto token = execution_token_t{};
  token.token_id = icnp::common::make_uuid();
  token.session_id = session.id;
  token.contract_id = contract.contract_id;
  token.issuer = issuer;
  for (const auto& executor :
       icnp::negotiation::contract_negotiator::required_signers(contract)) {
    const auto party = std::find_if(
        std::begin(contract.parties), std::end(contract.parties),
        [&](const actor_t& actor) { return actor.id == executor; });
    if (party != std::end(contract.parties)) {
      token.audience.push_back(*party);
    } else if (const auto known = session.participants.find(executor);
               known != session.participants.end()) {
      token.audience.push_back(known->second);
    } else {
      token.audience.push_back(actor_t{.id = executor});
    }
  }
  token.issued_at = now;
  token.validity = token_validity_t{.not_before = now,
                                    .not_after = now + options_.token_ttl_ms};
  token.limits.max_invocations_per_actor =
      read_limit(contract.constraints, "max_invocations_per_actor")
          .value_or(options_.default_max_invocations_per_actor);
  token.limits.max_invocations_total =
      read_limit(contract.constraints, "max_invocations_total");
  if (!token.limits.max_invocations_total) {
    token.limits.max_invocations_total =
        options_.default_max_invocations_total;
  }
  token.binding = *binding;

  const auto& signer = collaborators_.signer;
  if (!signer.sign) {
    return refuse(negotiation_error_code::collaborator_failure,
                  error_class_t::internal_error, "no token signer configured",
                  session.id);
  }
  auto body = canonical_bytes("token-canonicalize", make_signing_body(token));
  if (!body) {
    return refuse(negotiation_error_code::canonicalization_failed,
                  error_class_t::internal_error,
                  "token body has no canonical form", token.token_id, true);
  }
  auto sign = signer.sign;
  const auto key_id = options_.signing_key_id;
  const auto signature = icnp::execution::call_with_timeout<bytes_t>(
      collaborators_.workers.get(), "token-sign",
      options_.collaborator_timeout_ms,
      [sign, message = *body, key_id]() {
        auto value = sign(make_bytes_view(message), key_id);
        if (!value) {
          throw std::runtime_error{"signer refused the token body"};
        }
        return std::move(*value);
      });
  if (!signature) {
    return refuse(negotiation_error_code::collaborator_failure,
                  error_class_t::internal_error, "token signing failed",
                  token.token_id, true);
  }
  token.signature = signature_t{.alg = signer.algorithm,
                                .value = to_base64(*signature),
                                .key_id = key_id,
                                .signed_by = issuer.id,
                                .signed_at = icnp::common::format_rfc3339(now)};

  auto result = sessions_.transition(session, session_phase_t::token, now);
  if (!result.ok()) {
    return result;
  }
  auto issued = std::make_shared<icnp::session::issued_token_t>();
  issued->token = token;
  issued->signed_body = std::move(*body);
  session.token = std::move(issued);

  spdlog::info("Session {}: token {} issued for contract {}", session.id,
               token.token_id, token.contract_id);
  auto audience = json_t::array();
  for (const auto& member : token.audience) {
    audience.push_back(member.id);
  }
  audit_.append(icnp::audit::make_audit_event(
      audit_event_kind_t::token_issued, session.id,
      {token.token_id, token.contract_id}, now,
      json_t{{"token_id", token.token_id},
             {"contract_id", token.contract_id},
             {"audience", std::move(audience)},
             {"not_before", token.validity.not_before},
             {"not_after", token.validity.not_after},
             {"max_invocations_per_actor",
              token.limits.max_invocations_per_actor},
             {"binding_alg", algorithm}}));
  out = std::move(token);
  return make_success("token issued");
}

operation_result_t token_issuer::accept_external(
    icnp::session::session_t& session,
    const execution_token_t& token,
    const json_t& document,
    const timestamp_milliseconds_t now) {
  if (session.phase != session_phase_t::contract) {
    return invalid(session.token ? negotiation_error_code::token_already_issued
                                 : negotiation_error_code::contract_not_accepted,
                   "tokens are accepted in the contract phase",
                   std::string{to_string(session.phase)});
  }
  if (token.session_id != session.id) {
    return invalid(negotiation_error_code::token_session_mismatch,
                   "token names another session", token.session_id);
  }
  if (!session.contract ||
      session.contract->status != contract_status_t::accepted) {
    return invalid(negotiation_error_code::contract_not_accepted,
                   "session contract is not accepted", session.id);
  }
  if (token.contract_id != session.contract->contract.contract_id) {
    return invalid(negotiation_error_code::token_contract_mismatch,
                   "token names another contract", token.contract_id);
  }

  auto documents = make_binding_documents(session);
  if (!documents) {
    return invalid(negotiation_error_code::contract_not_accepted,
                   "session has nothing to bind", session.id);
  }
  auto canonicalizer = collaborators_.canonicalizer;
  const auto declared = token.binding;
  const auto recomputed = icnp::execution::call_with_timeout<bool>(
      collaborators_.workers.get(), "token-binding-check",
      options_.collaborator_timeout_ms,
      [documents = std::move(*documents), declared, canonicalizer]() {
        auto error = std::string{};
        return same_binding(declared.intent_hash,
                            hash_document(documents.intent,
                                          declared.intent_hash.alg,
                                          canonicalizer, error)) &&
               same_binding(declared.contract_hash,
                            hash_document(documents.contract,
                                          declared.contract_hash.alg,
                                          canonicalizer, error)) &&
               same_binding(declared.capabilities_hash,
                            hash_document(documents.capabilities,
                                          declared.capabilities_hash.alg,
                                          canonicalizer, error));
      });
  if (!recomputed) {
    return refuse(negotiation_error_code::collaborator_timeout,
                  error_class_t::token_invalid,
                  "token bindings could not be recomputed", token.token_id,
                  true);
  }
  if (!*recomputed) {
    return invalid(negotiation_error_code::token_binding_mismatch,
                   "token bindings do not match this session", token.token_id);
  }

  if (!token.signature) {
    return invalid(negotiation_error_code::token_signature_invalid,
                   "token is unsigned", token.token_id);
  }
  auto body = document;
  if (body.is_object()) {
    body.erase("signature");
  }
  auto signed_body = canonical_bytes("token-canonicalize", body);
  if (!signed_body) {
    return invalid(negotiation_error_code::token_signature_invalid,
                   "token has no canonical form", token.token_id);
  }
  const auto verified = verify(*signed_body, *token.signature);
  if (!verified) {
    return refuse(negotiation_error_code::collaborator_timeout,
                  error_class_t::token_invalid,
                  "token signature could not be verified", token.token_id,
                  true);
  }
  if (!*verified) {
    return invalid(negotiation_error_code::token_signature_invalid,
                   "token signature does not verify", token.token_id);
  }
  if (now >= token.validity.not_after) {
    return invalid(negotiation_error_code::token_expired,
                   "token has already expired", token.token_id);
  }

  auto result = sessions_.transition(session, session_phase_t::token, now);
  if (!result.ok()) {
    return result;
  }
  auto issued = std::make_shared<icnp::session::issued_token_t>();
  issued->token = token;
  issued->signed_body = std::move(*signed_body);
  session.token = std::move(issued);

  spdlog::info("Session {}: accepted token {} from {}", session.id,
               token.token_id, token.issuer.id);
  audit_.append(icnp::audit::make_audit_event(
      audit_event_kind_t::token_accepted, session.id,
      {token.token_id, token.contract_id}, now,
      json_t{{"token_id", token.token_id}, {"issuer", token.issuer.id}}));
  return make_success("token accepted");
}

operation_result_t token_issuer::check(
    const icnp::session::issued_token_t& issued,
    const timestamp_milliseconds_t now) const {
  const auto& token = issued.token;
  if (issued.revoked.load()) {
    return invalid(negotiation_error_code::token_revoked, "token is revoked",
                   token.token_id);
  }
  if (now < token.validity.not_before) {
    return invalid(negotiation_error_code::token_not_yet_valid,
                   "token is not valid yet", token.token_id);
  }
  if (now >= token.validity.not_after) {
    return invalid(negotiation_error_code::token_expired, "token has expired",
                   token.token_id);
  }
  if (!token.signature) {
    return invalid(negotiation_error_code::token_signature_invalid,
                   "token is unsigned", token.token_id);
  }
  const auto verified = verify(issued.signed_body, *token.signature);
  if (!verified) {
    return refuse(negotiation_error_code::collaborator_timeout,
                  error_class_t::token_invalid,
                  "token signature could not be verified", token.token_id,
                  true);
  }
  if (!*verified) {
    return invalid(negotiation_error_code::token_signature_invalid,
                   "token signature does not verify", token.token_id);
  }
  return make_success();
}

bool token_issuer::validate(const icnp::session::issued_token_t& issued,
                            const timestamp_milliseconds_t now) const {
  return check(issued, now).ok();
}

operation_result_t token_issuer::revoke(
    icnp::session::session_t& session,
    const std::string_view token_id,
    const std::optional<std::string>& reason,
    const timestamp_milliseconds_t now) {
  auto issued = resolve(session, token_id);
  if (!issued) {
    return invalid(negotiation_error_code::token_missing, "unknown token",
                   std::string{token_id});
  }
  if (issued->revoked.exchange(true)) {
    return make_success("already revoked");
  }

  spdlog::warn("Session {}: token {} revoked", session.id, token_id);
  auto details = json_t{{"token_id", std::string{token_id}},
                        {"method", issued->token.revocation_method}};
  if (reason) {
    details["reason"] = *reason;
  }
  audit_.append(icnp::audit::make_audit_event(
      audit_event_kind_t::token_revoked, session.id,
      {std::string{token_id}}, now, std::move(details),
      audit_severity_t::warning));
  return make_success("token revoked");
}

std::shared_ptr<icnp::session::issued_token_t> token_issuer::resolve(
    const icnp::session::session_t& session,
    const std::string_view token_id) {
  if (!session.token || session.token->token.token_id != token_id) {
    return nullptr;
  }
  return session.token;
}

operation_result_t token_issuer::try_consume(
    icnp::session::session_t& session,
    icnp::session::issued_token_t& issued,
    const agreed_action_t& agreed,
    const std::string& actor_id) const {
  const auto& limits = issued.token.limits;

  const auto actor_it = session.invocations_per_actor.find(actor_id);
  const auto per_actor =
      actor_it == session.invocations_per_actor.end() ? 0u : actor_it->second;
  if (per_actor >= limits.max_invocations_per_actor) {
    return refuse(negotiation_error_code::per_actor_limit_exceeded,
                  error_class_t::unauthorised_action,
                  "per-actor invocation limit reached",
                  fmt::format("{} ({}/{})", actor_id, per_actor,
                              limits.max_invocations_per_actor));
  }

  const auto key = action_key(agreed);
  const auto action_it = session.invocations_per_action.find(key);
  const auto per_action = action_it == session.invocations_per_action.end()
                              ? 0u
                              : action_it->second;
  if (agreed.max_invocations && per_action >= *agreed.max_invocations) {
    return refuse(negotiation_error_code::action_limit_exceeded,
                  error_class_t::unauthorised_action,
                  "agreed action invocation limit reached",
                  fmt::format("{} ({}/{})", key, per_action,
                              *agreed.max_invocations));
  }

  if (limits.max_invocations_total) {
    auto current = issued.invocations_total.load();
    do {
      if (current >= *limits.max_invocations_total) {
        return refuse(negotiation_error_code::total_limit_exceeded,
                      error_class_t::unauthorised_action,
                      "token invocation limit reached",
                      fmt::format("{}/{}", current,
                                  *limits.max_invocations_total));
      }
    } while (!issued.invocations_total.compare_exchange_weak(current,
                                                             current + 1));
  } else {
    issued.invocations_total.fetch_add(1);
  }

  session.invocations_per_actor[actor_id] = per_actor + 1;
  session.invocations_per_action[key] = per_action + 1;
  return make_success();
}

}  // namespace icnp::token
