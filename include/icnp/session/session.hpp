#pragma once

#include <icnp/schema/actor.hpp>
#include <icnp/schema/capability.hpp>
#include <icnp/schema/contract.hpp>
#include <icnp/schema/execution.hpp>
#include <icnp/schema/execution_token.hpp>
#include <icnp/schema/intent.hpp>
#include <icnp/schema/primitives.hpp>
#include <icnp/schema/session_phase.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace icnp::session {

struct intent_record_t final {
  icnp::schema::intent_t intent;
  // Declaration payload as received; input to the intent binding hash.
  icnp::schema::json_t document;
  std::string declared_by;
  icnp::schema::timestamp_milliseconds_t recorded_at{};
};

struct disclosed_capability_t final {
  std::string participant_id;
  icnp::schema::capability_t capability;
  icnp::schema::json_t document;
  icnp::schema::timestamp_milliseconds_t disclosed_at{};
};

struct contract_record_t final {
  icnp::schema::contract_t contract;
  // Contract object as proposed; input to the contract binding hash.
  icnp::schema::json_t document;
  std::string proposer_id;
  icnp::schema::contract_status_t status{
      icnp::schema::contract_status_t::proposed};
  // Zero for the first proposal, incremented by each counter-proposal.
  uint32_t revision{};
  icnp::schema::timestamp_milliseconds_t proposed_at{};
  std::optional<icnp::schema::timestamp_milliseconds_t> accepted_at;
};

/// An issued or accepted token together with its shared counters.
struct issued_token_t final {
  icnp::schema::execution_token_t token;
  // Canonical bytes covered by `token.signature`.
  icnp::schema::bytes_t signed_body;
  std::atomic<uint32_t> invocations_total{0};
  std::atomic<bool> revoked{false};
};

struct invocation_record_t final {
  std::string invocation_id;
  std::string token_id;
  std::string executor_id;
  std::string action;
  std::optional<std::string> scope;
  icnp::schema::invocation_state_t state{
      icnp::schema::invocation_state_t::received};
  // Allowed to run although the request violated the contract.
  bool violation{};
  icnp::schema::timestamp_milliseconds_t received_at{};
  std::optional<icnp::schema::timestamp_milliseconds_t> finished_at;
};

/// All state of one negotiation. Reachable only through the session store,
/// which hands out exclusive leases.
struct session_t final {
  std::string id;
  icnp::schema::session_phase_t phase{icnp::schema::session_phase_t::intent};
  icnp::schema::actor_t initiator;
  std::map<std::string, icnp::schema::actor_t> participants;
  std::unordered_set<std::string> seen_message_ids;
  // Ids of envelopes this engine sent into the session; peers may reply to
  // them.
  std::unordered_set<std::string> sent_message_ids;
  icnp::schema::timestamp_milliseconds_t created_at{};
  icnp::schema::timestamp_milliseconds_t negotiation_deadline{};

  std::optional<intent_record_t> intent;
  std::vector<disclosed_capability_t> capabilities;
  std::optional<contract_record_t> contract;
  std::vector<std::string> superseded_contract_ids;
  std::shared_ptr<issued_token_t> token;

  std::map<std::string, uint32_t> invocations_per_actor;
  // Keyed by agreed action id.
  std::map<std::string, uint32_t> invocations_per_action;
  std::unordered_set<std::string> seen_nonces;
  std::map<std::string, invocation_record_t> invocations;
};

struct session_slot_t final {
  std::mutex mutex;
  session_t session;
};

}  // namespace icnp::session
