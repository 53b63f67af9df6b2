#pragma once

#include <icnp/audit/audit_log.hpp>
#include <icnp/config/engine_options.hpp>
#include <icnp/execution/collaborators.hpp>
#include <icnp/schema/actor.hpp>
#include <icnp/schema/contract.hpp>
#include <icnp/schema/operation_result.hpp>
#include <icnp/schema/primitives.hpp>
#include <icnp/session/session.hpp>
#include <icnp/session/session_store.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace icnp::negotiation {

/// Builds and freezes the session contract.
///
/// Authorization under a contract follows forbidden-action dominance: an
/// agreed action is effective only when no forbidden entry names the same
/// action with the same scope, a wildcard scope (`any`, `*`) or no scope.
class contract_negotiator final {
 public:
  contract_negotiator(icnp::audit::audit_log& audit,
                      icnp::session::session_store& sessions,
                      const icnp::config::engine_options_t& options,
                      const icnp::execution::collaborators_t& collaborators);

  /// Initial proposal (or a fresh proposal superseding an unaccepted one) by
  /// the session initiator. Moves capability -> contract.
  icnp::schema::operation_result_t propose(
      icnp::session::session_t& session,
      const icnp::schema::actor_t& proposer,
      const icnp::schema::contract_t& draft,
      std::optional<icnp::schema::json_t> document,
      icnp::schema::timestamp_milliseconds_t now);

  /// Replace the pending draft. Collected signatures are discarded.
  icnp::schema::operation_result_t counter_propose(
      icnp::session::session_t& session,
      const icnp::schema::actor_t& proposer,
      const icnp::schema::contract_t& draft,
      std::optional<icnp::schema::json_t> document,
      icnp::schema::timestamp_milliseconds_t now);

  /// Record `signer`'s acceptance. The contract is frozen once every
  /// executor named in `agreed_actions` has signed and the approval gate
  /// passes. Without a signature the envelope sender's acceptance is recorded
  /// with algorithm `envelope`.
  icnp::schema::operation_result_t accept(
      icnp::session::session_t& session,
      std::string_view contract_id,
      const icnp::schema::actor_t& signer,
      const std::optional<icnp::schema::signature_t>& signature,
      icnp::schema::timestamp_milliseconds_t now);

  /// Reject the pending contract and abort the session.
  icnp::schema::operation_result_t reject(
      icnp::session::session_t& session,
      std::string_view contract_id,
      const icnp::schema::actor_t& rejector,
      const std::optional<std::string>& reason,
      icnp::schema::timestamp_milliseconds_t now);

  /// When the intent or any selected capability action requires approval,
  /// at least one `approve` and no `reject` must be present.
  static icnp::schema::operation_result_t check_approval_gate(
      const icnp::session::session_t& session,
      const icnp::schema::contract_t& contract);

  static bool forbids(const icnp::schema::contract_t& contract,
                      std::string_view action,
                      std::string_view scope);

  /// Agreed actions that survive forbidden-action dominance.
  static std::vector<const icnp::schema::agreed_action_t*> effective_actions(
      const icnp::schema::contract_t& contract);

  /// The effective agreed action authorizing `executor_id` to perform
  /// `action` (in `scope`, when given), or null.
  static const icnp::schema::agreed_action_t* authorize(
      const icnp::schema::contract_t& contract,
      std::string_view action,
      std::string_view executor_id,
      const std::optional<std::string>& scope);

  static bool is_authorized(const icnp::schema::contract_t& contract,
                            std::string_view action,
                            std::string_view executor_id,
                            const std::optional<std::string>& scope);

  /// Executors named in `agreed_actions`, sorted and unique.
  static std::vector<std::string> required_signers(
      const icnp::schema::contract_t& contract);

 private:
  icnp::schema::operation_result_t validate_draft(
      const icnp::session::session_t& session,
      const icnp::schema::contract_t& draft) const;

  icnp::schema::operation_result_t verify_signature(
      const icnp::session::contract_record_t& record,
      const icnp::schema::signature_t& signature) const;

  void install(icnp::session::session_t& session,
               const icnp::schema::actor_t& proposer,
               const icnp::schema::contract_t& draft,
               std::optional<icnp::schema::json_t> document,
               icnp::schema::timestamp_milliseconds_t now);

  icnp::audit::audit_log& audit_;
  icnp::session::session_store& sessions_;
  const icnp::config::engine_options_t& options_;
  const icnp::execution::collaborators_t& collaborators_;
};

/// Bytes a party signs to accept a contract: the canonical contract document
/// without its `signatures` member.
icnp::schema::json_t make_contract_signing_body(
    const icnp::schema::json_t& contract_document);

}  // namespace icnp::negotiation
