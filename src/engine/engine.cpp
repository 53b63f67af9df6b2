#include <icnp/common/time.hpp>
#include <icnp/common/uuid.hpp>
#include <icnp/engine/engine.hpp>
#include <icnp/schema/encoding/json/encoder.hpp>
#include <icnp/schema/payload.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

using namespace icnp::schema;

namespace icnp::engine {

namespace {

constexpr auto kCodespace = std::string_view{"icnp.engine"};
constexpr auto kPendingCallsPerThread = std::size_t{16};
constexpr auto kRememberedOrphans = std::size_t{4096};

bool is_execution_message(const message_type_t type) {
  return type == message_type_t::execution_request ||
         type == message_type_t::execution_result;
}

// Execution traffic is answered with token_invalid when the session cannot
// execute; negotiation traffic with constraints_unsatisfiable.
error_class_t session_error_class(const message_type_t type) {
  return is_execution_message(type) ? error_class_t::token_invalid
                                    : error_class_t::constraints_unsatisfiable;
}

std::optional<std::string> uuid_member(const json_t& document,
                                       const char* key) {
  if (!document.is_object()) {
    return std::nullopt;
  }
  const auto it = document.find(key);
  if (it == document.end() || !it->is_string() ||
      !icnp::common::is_uuid(it->get_ref<const std::string&>())) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

std::optional<actor_t> sender_of(const json_t& document) {
  if (!document.is_object()) {
    return std::nullopt;
  }
  const auto it = document.find("sender");
  if (it == document.end()) {
    return std::nullopt;
  }
  auto encoder = encoding::encoder<encoding::json_encoder_tag>{};
  auto error = std::string{};
  return encoder.try_decode<actor_t>(*it, error);
}

json_t member_or_empty(const json_t& document, const char* key) {
  const auto it = document.find(key);
  return it == document.end() ? json_t::object() : *it;
}

std::vector<json_t> array_member(const json_t& document, const char* key) {
  auto result = std::vector<json_t>{};
  const auto it = document.find(key);
  if (it != document.end() && it->is_array()) {
    for (const auto& element : *it) {
      result.push_back(element);
    }
  }
  return result;
}

icnp::execution::collaborators_t with_workers(
    icnp::execution::collaborators_t collaborators,
    const icnp::config::engine_options_t& options) {
  if (!collaborators.workers && options.collaborator_timeout_ms != 0) {
    const auto threads = std::size_t{options.collaborator_threads};
    collaborators.workers = std::make_shared<icnp::execution::worker_pool>(
        threads, threads * kPendingCallsPerThread);
  }
  return collaborators;
}

}  // namespace

engine::engine(icnp::config::engine_options_t options,
               icnp::execution::collaborators_t collaborators)
    : options_(std::move(options)),
      collaborators_(with_workers(std::move(collaborators), options_)),
      audit_(collaborators_.audit_sink),
      sessions_(audit_),
      validator_(options_.icnp_version.substr(0,
                                              options_.icnp_version.find('.'))),
      intents_(audit_),
      capabilities_(audit_, sessions_, collaborators_.scorer),
      negotiator_(audit_, sessions_, options_, collaborators_),
      issuer_(audit_, sessions_, options_, collaborators_),
      gate_(audit_, sessions_, issuer_, options_, collaborators_) {}

timestamp_milliseconds_t engine::now() const {
  return collaborators_.clock ? collaborators_.clock()
                              : icnp::common::now_milliseconds();
}

icnp::audit::audit_log& engine::audit() {
  return audit_;
}

icnp::session::session_store& engine::sessions() {
  return sessions_;
}

const icnp::config::engine_options_t& engine::options() const {
  return options_;
}

envelope_t engine::make_envelope(
    const message_type_t type,
    const std::string& session_id,
    json_t payload,
    const std::optional<actor_t>& recipient,
    const std::optional<std::string>& in_reply_to) const {
  auto envelope = envelope_t{};
  envelope.icnp_version = options_.icnp_version;
  envelope.type = type;
  envelope.phase = expected_phase(type);
  envelope.message_id = icnp::common::make_uuid();
  envelope.session_id = session_id;
  envelope.timestamp = icnp::common::format_rfc3339(now());
  envelope.sender = options_.identity;
  envelope.recipient = recipient;
  envelope.in_reply_to = in_reply_to;
  envelope.payload = std::move(payload);
  return envelope;
}

json_t engine::make_error_envelope(
    const std::string& session_id,
    const std::optional<actor_t>& recipient,
    const std::optional<std::string>& related_message_id,
    const operation_result_t& result,
    const timestamp_milliseconds_t now) const {
  auto report = error_report_t{};
  report.error_id = icnp::common::make_uuid();
  report.code = std::string{to_protocol_code(result.error)};
  report.message = result.log;
  report.retryable = result.retryable;
  report.related_message_id = related_message_id;
  report.timestamp = icnp::common::format_rfc3339(now);
  report.details = json_t{{"detail_code", result.code},
                          {"error", std::string{to_string(result.error)}},
                          {"codespace", result.codespace}};
  if (!result.info.empty()) {
    (*report.details)["info"] = result.info;
  }

  auto encoder = encoding::encoder<encoding::json_encoder_tag>{};
  auto envelope = make_envelope(
      message_type_t::error, session_id,
      encoder.to_document(error_message_t{.error = std::move(report)}),
      recipient, related_message_id);
  return encoder.to_document(envelope);
}

void engine::audit_rejection(const std::string& session_id,
                             std::vector<std::string> subject_ids,
                             const operation_result_t& result,
                             json_t details,
                             const timestamp_milliseconds_t now) {
  details["code"] = result.code;
  details["error"] = std::string{to_string(result.error)};
  details["reason"] = result.log;
  details["codespace"] = result.codespace;
  if (!result.info.empty()) {
    details["info"] = result.info;
  }
  audit_.append(icnp::audit::make_audit_event(
      audit_event_kind_t::message_rejected, session_id, std::move(subject_ids),
      now, std::move(details), audit_severity_t::warning));
}

void engine::reject(process_result_t& out,
                    icnp::session::session_t* session,
                    const envelope_t& envelope,
                    const operation_result_t& result,
                    const timestamp_milliseconds_t now,
                    const bool audited) {
  spdlog::warn("Session {}: {} {} rejected: {} ({})", envelope.session_id,
               to_string(envelope.type), envelope.message_id, result.log,
               result.info);
  if (!audited) {
    audit_rejection(envelope.session_id, {envelope.message_id}, result,
                    json_t{{"message_id", envelope.message_id},
                           {"type", std::string{to_string(envelope.type)}},
                           {"sender", envelope.sender.id}},
                    now);
  }
  if (session && result.retryable) {
    validator_.forget(*session, envelope.message_id);
  }

  auto response = make_error_envelope(envelope.session_id, envelope.sender,
                                      envelope.message_id, result, now);
  if (envelope.trace) {
    response["trace"] = *envelope.trace;
  }
  if (session) {
    validator_.record_sent(*session,
                           response["message_id"].get<std::string>());
  }
  out.status = result;
  out.responses.push_back(std::move(response));
}

bool engine::first_orphan_rejection(const std::string& message_id) {
  auto lock = std::lock_guard<std::mutex>{orphans_mutex_};
  if (!orphan_ids_.insert(message_id).second) {
    return false;
  }
  orphan_order_.push_back(message_id);
  if (orphan_order_.size() > kRememberedOrphans) {
    orphan_ids_.erase(orphan_order_.front());
    orphan_order_.pop_front();
  }
  return true;
}

process_result_t engine::process(const std::string_view raw) {
  auto document = json_t::parse(raw, nullptr, false);
  if (!document.is_discarded()) {
    return process_document(document);
  }

  const auto now = this->now();
  const auto result = make_failure(
      negotiation_error_code::malformed_envelope, error_class_t::invalid_intent,
      "envelope is not valid JSON", {}, "icnp.envelope");
  spdlog::warn("Rejected unparseable envelope");
  audit_rejection({}, {}, result, json_t::object(), now);
  auto out = process_result_t{};
  out.status = result;
  out.responses.push_back(
      make_error_envelope({}, std::nullopt, std::nullopt, result, now));
  return out;
}

process_result_t engine::process_document(const json_t& document) {
  const auto now = this->now();
  auto envelope = envelope_t{};
  auto result = validator_.decode(document, envelope);
  if (!result.ok()) {
    auto out = process_result_t{};
    const auto session_id = uuid_member(document, "session_id").value_or("");
    const auto message_id = uuid_member(document, "message_id");
    spdlog::warn("Rejected envelope {}: {} ({})", message_id.value_or("?"),
                 result.log, result.info);
    auto subjects = std::vector<std::string>{};
    if (message_id) {
      subjects.push_back(*message_id);
    }
    audit_rejection(session_id, std::move(subjects), result,
                    json_t{{"message_id", message_id.value_or("")}}, now);
    out.status = result;
    out.responses.push_back(make_error_envelope(
        session_id, sender_of(document), message_id, result, now));
    return out;
  }

  auto lease = sessions_.acquire(envelope.session_id);
  if (!lease) {
    if (envelope.type != message_type_t::intent_declaration) {
      // A redelivery is answered again but audited once.
      auto out = process_result_t{};
      reject(out, nullptr, envelope,
             make_failure(negotiation_error_code::session_missing,
                          session_error_class(envelope.type),
                          "unknown session", envelope.session_id,
                          std::string{kCodespace}),
             now, !first_orphan_rejection(envelope.message_id));
      return out;
    }
    auto created = false;
    lease.emplace(sessions_.open(envelope.session_id, envelope.sender, now,
                                 options_.negotiation_ttl_ms, created));
  }
  auto& session = **lease;
  sessions_.expire_if_due(session, now);

  auto duplicate = false;
  result = validator_.admit(session, envelope, duplicate);
  if (!result.ok()) {
    auto out = process_result_t{};
    reject(out, &session, envelope, result, now);
    return out;
  }
  if (duplicate) {
    auto out = process_result_t{};
    out.status = result;
    out.duplicate = true;
    return out;
  }

  const auto peer_report = envelope.type == message_type_t::audit_event ||
                           envelope.type == message_type_t::error;
  if (is_terminal(session.phase) && !peer_report) {
    auto out = process_result_t{};
    const auto expired = session.phase == session_phase_t::expired;
    reject(out, &session, envelope,
           make_failure(expired ? negotiation_error_code::session_expired
                                : negotiation_error_code::session_terminal,
                        session_error_class(envelope.type),
                        expired ? "session expired" : "session has ended",
                        std::string{to_string(session.phase)},
                        std::string{kCodespace}),
           now);
    return out;
  }

  return dispatch(session, envelope, now);
}

process_result_t engine::dispatch(icnp::session::session_t& session,
                                  const envelope_t& envelope,
                                  const timestamp_milliseconds_t now) {
  auto out = process_result_t{};
  auto error = std::string{};
  auto payload = try_decode_payload(envelope.type, envelope.payload, error);
  if (!payload) {
    reject(out, &session, envelope,
           make_failure(negotiation_error_code::malformed_payload,
                        error_class_t::invalid_intent,
                        "payload does not match its message type", error,
                        std::string{kCodespace}),
           now);
    return out;
  }

  const auto& sender = envelope.sender;
  auto gate_audited = false;
  auto encoder = encoding::encoder<encoding::json_encoder_tag>{};

  const auto issue_after_acceptance = [&]() {
    if (!options_.auto_issue_token || !session.contract ||
        session.contract->status != contract_status_t::accepted) {
      return;
    }
    auto token = execution_token_t{};
    auto issued = issuer_.issue(session, options_.identity, now, token);
    if (!issued.ok()) {
      spdlog::warn("Session {}: automatic token issue failed: {}", session.id,
                   issued.log);
      audit_rejection(session.id, {envelope.message_id}, issued,
                      json_t{{"operation", "issue_token"}}, now);
      auto response = make_error_envelope(session.id, sender,
                                          envelope.message_id, issued, now);
      validator_.record_sent(session,
                             response["message_id"].get<std::string>());
      out.responses.push_back(std::move(response));
      return;
    }
    const auto outbound = make_envelope(
        message_type_t::execution_token, session.id,
        encoder.to_document(execution_token_message_t{.token = token}),
        std::nullopt, envelope.message_id);
    validator_.record_sent(session, outbound.message_id);
    out.responses.push_back(encoder.to_document(outbound));
  };

  auto result = std::visit(
      overloaded{
          [&](const intent_declaration_t& message) {
            return intents_.record_intent(session, sender, message.intent,
                                          envelope.payload, now);
          },
          [&](const capability_disclosure_t& message) {
            return capabilities_.disclose(
                session, sender, message.capabilities,
                array_member(envelope.payload, "capabilities"), now);
          },
          [&](const contract_proposal_t& message) {
            return negotiator_.propose(
                session, sender, message.contract,
                member_or_empty(envelope.payload, "contract"), now);
          },
          [&](const contract_counterproposal_t& message) {
            return negotiator_.counter_propose(
                session, sender, message.contract,
                member_or_empty(envelope.payload, "contract"), now);
          },
          [&](const contract_acceptance_t& message) {
            const auto contract_id =
                message.contract_id
                    ? *message.contract_id
                    : (message.contract ? message.contract->contract_id
                                        : std::string{});
            if (message.decision == acceptance_decision_t::reject) {
              return negotiator_.reject(session, contract_id, sender,
                                        message.reason, now);
            }
            auto accepted = negotiator_.accept(session, contract_id, sender,
                                               message.signature, now);
            if (accepted.ok()) {
              issue_after_acceptance();
            }
            return accepted;
          },
          [&](const contract_rejection_t& message) {
            return negotiator_.reject(session, message.contract_id, sender,
                                      message.reason, now);
          },
          [&](const execution_token_message_t& message) {
            return issuer_.accept_external(
                session, message.token,
                member_or_empty(envelope.payload, "token"), now);
          },
          [&](const execution_request_message_t& message) {
            auto decision = gate_.evaluate(session, message.request, now);
            gate_audited = decision.violation;
            auto status = decision.allowed ? make_success("invocation started")
                                           : decision.result;
            out.decision = std::move(decision);
            return status;
          },
          [&](const execution_result_message_t& message) {
            return gate_.complete(session, sender, message.result, now);
          },
          [&](const audit_event_message_t& message) {
            audit_.append(icnp::audit::make_audit_event(
                audit_event_kind_t::peer_audit, session.id,
                {envelope.message_id, sender.id}, now,
                json_t{{"sender", sender.id}, {"event", message.event}}));
            return make_success("peer audit recorded");
          },
          [&](const error_message_t& message) {
            auto details = json_t{{"sender", sender.id},
                                  {"error_id", message.error.error_id},
                                  {"code", message.error.code},
                                  {"message", message.error.message},
                                  {"retryable", message.error.retryable}};
            if (message.error.related_message_id) {
              details["related_message_id"] =
                  *message.error.related_message_id;
            }
            spdlog::warn("Session {}: peer {} reported {}: {}", session.id,
                         sender.id, message.error.code, message.error.message);
            audit_.append(icnp::audit::make_audit_event(
                audit_event_kind_t::peer_error, session.id,
                {envelope.message_id, sender.id}, now, std::move(details),
                audit_severity_t::warning));
            return make_success("peer error recorded");
          }},
      *payload);

  if (!result.ok()) {
    reject(out, &session, envelope, result, now, gate_audited);
    return out;
  }
  out.status = std::move(result);
  return out;
}

operation_result_t engine::issue_token(const std::string_view session_id,
                                       execution_token_t& out) {
  const auto now = this->now();
  auto lease = sessions_.acquire(session_id);
  if (!lease) {
    return make_failure(negotiation_error_code::session_missing,
                        error_class_t::token_invalid, "unknown session",
                        std::string{session_id}, std::string{kCodespace});
  }
  auto& session = **lease;
  sessions_.expire_if_due(session, now);
  auto result = issuer_.issue(session, options_.identity, now, out);
  if (!result.ok()) {
    audit_rejection(session.id, {}, result,
                    json_t{{"operation", "issue_token"}}, now);
  }
  return result;
}

operation_result_t engine::complete_invocation(
    const std::string_view session_id,
    const execution_result_t& result) {
  const auto now = this->now();
  auto lease = sessions_.acquire(session_id);
  if (!lease) {
    return make_failure(negotiation_error_code::session_missing,
                        error_class_t::token_invalid, "unknown session",
                        std::string{session_id}, std::string{kCodespace});
  }
  auto& session = **lease;
  const auto it = session.invocations.find(result.invocation_id);
  auto reporter = actor_t{};
  if (it != session.invocations.end()) {
    reporter.id = it->second.executor_id;
  }
  auto completed = gate_.complete(session, reporter, result, now);
  if (!completed.ok()) {
    audit_rejection(session.id, {result.invocation_id}, completed,
                    json_t{{"operation", "complete_invocation"}}, now);
  }
  return completed;
}

operation_result_t engine::complete_session(const std::string_view session_id) {
  const auto now = this->now();
  auto lease = sessions_.acquire(session_id);
  if (!lease) {
    return make_failure(negotiation_error_code::session_missing,
                        error_class_t::constraints_unsatisfiable,
                        "unknown session", std::string{session_id},
                        std::string{kCodespace});
  }
  auto& session = **lease;
  auto result = sessions_.transition(session, session_phase_t::completed, now);
  if (!result.ok()) {
    audit_rejection(session.id, {}, result,
                    json_t{{"operation", "complete_session"}}, now);
  }
  return result;
}

operation_result_t engine::revoke_token(
    const std::string_view session_id,
    const std::string_view token_id,
    const std::optional<std::string>& reason) {
  const auto now = this->now();
  auto lease = sessions_.acquire(session_id);
  if (!lease) {
    return make_failure(negotiation_error_code::session_missing,
                        error_class_t::token_invalid, "unknown session",
                        std::string{session_id}, std::string{kCodespace});
  }
  auto& session = **lease;
  auto result = issuer_.revoke(session, token_id, reason, now);
  if (!result.ok()) {
    audit_rejection(session.id, {std::string{token_id}}, result,
                    json_t{{"operation", "revoke_token"}}, now);
  }
  return result;
}

std::vector<icnp::registry::capability_match_t> engine::match(
    const std::string_view session_id,
    const std::string_view requested_action) {
  auto lease = sessions_.acquire(session_id);
  if (!lease) {
    return {};
  }
  return capabilities_.match(**lease, requested_action);
}

std::optional<json_t> engine::snapshot(const std::string_view session_id) {
  auto lease = sessions_.acquire(session_id);
  if (!lease) {
    return std::nullopt;
  }
  const auto& session = **lease;
  auto encoder = encoding::encoder<encoding::json_encoder_tag>{};

  auto participants = json_t::array();
  for (const auto& [id, actor] : session.participants) {
    participants.push_back(encoder.to_document(actor));
  }
  auto capabilities = json_t::array();
  for (const auto& disclosed : session.capabilities) {
    capabilities.push_back(
        json_t{{"capability_id", disclosed.capability.capability_id},
               {"participant", disclosed.participant_id}});
  }
  auto invocations = json_t::object();
  for (const auto& [id, record] : session.invocations) {
    invocations[id] = json_t{{"executor", record.executor_id},
                             {"action", record.action},
                             {"state", std::string{to_string(record.state)}},
                             {"violation", record.violation}};
  }

  auto view = json_t{{"session_id", session.id},
                     {"phase", std::string{to_string(session.phase)}},
                     {"initiator", session.initiator.id},
                     {"participants", std::move(participants)},
                     {"created_at", session.created_at},
                     {"negotiation_deadline", session.negotiation_deadline},
                     {"capabilities", std::move(capabilities)},
                     {"superseded_contracts", session.superseded_contract_ids},
                     {"invocations", std::move(invocations)}};
  if (session.intent) {
    view["intent"] = encoder.to_document(
        intent_declaration_t{.intent = session.intent->intent});
  }
  if (session.contract) {
    view["contract"] = encoder.to_document(session.contract->contract);
    view["contract_status"] =
        std::string{to_string(session.contract->status)};
    view["contract_revision"] = session.contract->revision;
  }
  if (session.token) {
    view["token"] = encoder.to_document(session.token->token);
    view["token_revoked"] = session.token->revoked.load();
    view["invocations_total"] = session.token->invocations_total.load();
  }
  return view;
}

}  // namespace icnp::engine
