#include <icnp/registry/capability_ledger.hpp>
#include <icnp/schema/encoding/json/encoder.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

#include <spdlog/spdlog.h>

using namespace icnp::schema;

namespace icnp::registry {

namespace {

constexpr auto kCodespace = std::string_view{"icnp.capability"};

operation_result_t reject(const negotiation_error_code code,
                          std::string log,
                          std::string info = {}) {
  return make_failure(code, error_class_t::capability_mismatch, std::move(log),
                      std::move(info), std::string{kCodespace});
}

operation_result_t check_well_formed(const capability_t& capability) {
  if (capability.capability_id.empty() || capability.actions.empty()) {
    return reject(negotiation_error_code::capability_malformed,
                  "capability needs an id and at least one action",
                  capability.capability_id);
  }
  for (const auto& action : capability.actions) {
    if (action.action.empty()) {
      return reject(negotiation_error_code::capability_malformed,
                    "capability action without a name",
                    capability.capability_id);
    }
    if (!std::isfinite(action.confidence) || action.confidence < 0.0 ||
        action.confidence > 1.0) {
      return reject(negotiation_error_code::capability_confidence_out_of_range,
                    "confidence must lie in [0, 1]",
                    capability.capability_id + "/" + action.action);
    }
  }
  return make_success();
}

}  // namespace

capability_ledger::capability_ledger(icnp::audit::audit_log& audit,
                                     icnp::session::session_store& sessions,
                                     icnp::execution::capability_scorer_t scorer)
    : audit_(audit), sessions_(sessions), scorer_(std::move(scorer)) {}

operation_result_t capability_ledger::disclose(
    icnp::session::session_t& session,
    const actor_t& participant,
    const std::vector<capability_t>& capabilities,
    const std::vector<json_t>& documents,
    const timestamp_milliseconds_t now) {
  if (session.phase != session_phase_t::intent &&
      session.phase != session_phase_t::capability) {
    return reject(negotiation_error_code::capability_disclosure_closed,
                  "capability disclosure is closed",
                  std::string{to_string(session.phase)});
  }
  if (!session.intent) {
    return make_failure(negotiation_error_code::intent_not_recorded,
                        error_class_t::invalid_intent,
                        "no intent has been recorded", session.id,
                        std::string{kCodespace});
  }
  if (capabilities.empty()) {
    return reject(negotiation_error_code::capability_malformed,
                  "disclosure carries no capabilities");
  }
  if (!documents.empty() && documents.size() != capabilities.size()) {
    return reject(negotiation_error_code::capability_malformed,
                  "capability documents do not match capabilities");
  }

  auto fresh = std::vector<std::size_t>{};
  for (auto i = std::size_t{0}; i < capabilities.size(); ++i) {
    const auto& capability = capabilities[i];
    auto result = check_well_formed(capability);
    if (!result.ok()) {
      return result;
    }

    if (const auto* existing = lookup(session, capability.capability_id)) {
      if (existing->participant_id != participant.id ||
          !(existing->capability == capability)) {
        return reject(negotiation_error_code::capability_conflict,
                      "capability id already disclosed with other content",
                      capability.capability_id);
      }
      continue;
    }

    const auto earlier = std::find_if(
        std::begin(fresh), std::end(fresh), [&](const std::size_t index) {
          return capabilities[index].capability_id == capability.capability_id;
        });
    if (earlier != std::end(fresh)) {
      if (!(capabilities[*earlier] == capability)) {
        return reject(negotiation_error_code::capability_conflict,
                      "capability id repeated with other content",
                      capability.capability_id);
      }
      continue;
    }
    fresh.push_back(i);
  }

  if (fresh.empty()) {
    spdlog::debug("Session {}: re-disclosure from {} changed nothing",
                  session.id, participant.id);
    return make_success("no new capabilities");
  }

  if (session.phase == session_phase_t::intent) {
    auto result = sessions_.transition(session, session_phase_t::capability, now);
    if (!result.ok()) {
      return result;
    }
  }

  auto encoder = encoding::encoder<encoding::json_encoder_tag>{};
  auto ids = std::vector<std::string>{};
  for (const auto index : fresh) {
    const auto& capability = capabilities[index];
    auto document = documents.empty() ? encoder.to_document(capability)
                                      : documents[index];
    session.capabilities.push_back(icnp::session::disclosed_capability_t{
        .participant_id = participant.id,
        .capability = capability,
        .document = std::move(document),
        .disclosed_at = now});
    ids.push_back(capability.capability_id);
  }
  session.participants.try_emplace(participant.id, participant);

  spdlog::info("Session {}: {} disclosed {} capability(ies)", session.id,
               participant.id, ids.size());
  auto subjects = ids;
  subjects.insert(std::begin(subjects), participant.id);
  audit_.append(icnp::audit::make_audit_event(
      audit_event_kind_t::capability_disclosed, session.id,
      std::move(subjects), now,
      json_t{{"participant", participant.id}, {"capability_ids", ids}}));
  return make_success("capabilities disclosed");
}

const icnp::session::disclosed_capability_t* capability_ledger::lookup(
    const icnp::session::session_t& session,
    const std::string_view capability_id) {
  const auto it = std::find_if(
      std::begin(session.capabilities), std::end(session.capabilities),
      [&](const icnp::session::disclosed_capability_t& disclosed) {
        return disclosed.capability.capability_id == capability_id;
      });
  return it == std::end(session.capabilities) ? nullptr : &*it;
}

std::vector<capability_match_t> capability_ledger::match(
    const icnp::session::session_t& session,
    const std::string_view requested_action) const {
  auto result = std::vector<capability_match_t>{};
  for (const auto& disclosed : session.capabilities) {
    auto best = 0.0;
    auto best_action = std::string{};
    for (const auto& offered : disclosed.capability.actions) {
      const auto score = scorer_ ? scorer_(requested_action, offered) : 0.0;
      if (score > best) {
        best = score;
        best_action = offered.action;
      }
    }
    if (best > 0.0) {
      result.push_back(capability_match_t{
          .participant_id = disclosed.participant_id,
          .capability_id = disclosed.capability.capability_id,
          .action = std::move(best_action),
          .score = best});
    }
  }
  std::sort(std::begin(result), std::end(result),
            [](const capability_match_t& lhs, const capability_match_t& rhs) {
              if (lhs.score != rhs.score) {
                return lhs.score > rhs.score;
              }
              return lhs.capability_id < rhs.capability_id;
            });
  return result;
}

}  // namespace icnp::registry
