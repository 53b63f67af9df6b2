#pragma once

#include <icnp/audit/audit_log.hpp>
#include <icnp/config/engine_options.hpp>
#include <icnp/enforcement/enforcement_gate.hpp>
#include <icnp/envelope/validator.hpp>
#include <icnp/execution/collaborators.hpp>
#include <icnp/negotiation/contract_negotiator.hpp>
#include <icnp/registry/capability_ledger.hpp>
#include <icnp/registry/intent_registry.hpp>
#include <icnp/schema/envelope.hpp>
#include <icnp/schema/execution.hpp>
#include <icnp/schema/execution_token.hpp>
#include <icnp/schema/operation_result.hpp>
#include <icnp/schema/primitives.hpp>
#include <icnp/session/session_store.hpp>
#include <icnp/token/token_issuer.hpp>

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace icnp::engine {

/// Result of handling one inbound envelope.
struct process_result_t final {
  icnp::schema::operation_result_t status;
  // The message id was already seen; nothing changed.
  bool duplicate{};
  // Outbound envelopes produced while handling (tokens, errors).
  std::vector<icnp::schema::json_t> responses;
  // Present for execution requests.
  std::optional<icnp::enforcement::execution_decision_t> decision;
};

/// ICNP protocol engine.
///
/// Decodes and admits inbound envelopes, routes each typed payload to the
/// component owning its message type, and builds the outbound envelopes the
/// protocol requires. Each message is handled under its session's exclusive
/// lease, so messages of one session are serialized while different sessions
/// proceed concurrently.
///
/// Every rejected operation leaves exactly one audit record: `violation` for
/// execution denials, `message_rejected` for everything else. Rejections are
/// answered with an `error` envelope that replies to the offending message.
class engine final {
 public:
  /// Construct an engine. Options are validated by the caller; see
  /// `icnp::config::validate`. Without a worker pool in `collaborators` the
  /// engine starts its own for calls that have a deadline.
  engine(icnp::config::engine_options_t options,
         icnp::execution::collaborators_t collaborators);

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Handle one envelope given as JSON text.
  process_result_t process(std::string_view raw);

  /// Handle one already parsed envelope.
  process_result_t process_document(const icnp::schema::json_t& document);

  /// Issue the execution token of the session's accepted contract with this
  /// engine as issuer.
  icnp::schema::operation_result_t issue_token(
      std::string_view session_id,
      icnp::schema::execution_token_t& out);

  /// Close an executing invocation on behalf of its executor.
  icnp::schema::operation_result_t complete_invocation(
      std::string_view session_id,
      const icnp::schema::execution_result_t& result);

  /// Move an executing session to `completed`.
  icnp::schema::operation_result_t complete_session(
      std::string_view session_id);

  icnp::schema::operation_result_t revoke_token(
      std::string_view session_id,
      std::string_view token_id,
      const std::optional<std::string>& reason = std::nullopt);

  /// Ranked capability candidates for `requested_action` in a session.
  std::vector<icnp::registry::capability_match_t> match(
      std::string_view session_id,
      std::string_view requested_action);

  /// Read-only summary of one session, or `std::nullopt` when unknown.
  std::optional<icnp::schema::json_t> snapshot(std::string_view session_id);

  /// Envelope of `type` from this engine, replying to `in_reply_to` when set.
  icnp::schema::envelope_t make_envelope(
      icnp::schema::message_type_t type,
      const std::string& session_id,
      icnp::schema::json_t payload,
      const std::optional<icnp::schema::actor_t>& recipient = std::nullopt,
      const std::optional<std::string>& in_reply_to = std::nullopt) const;

  icnp::audit::audit_log& audit();
  icnp::session::session_store& sessions();
  const icnp::config::engine_options_t& options() const;

 private:
  icnp::schema::timestamp_milliseconds_t now() const;

  /// Audit a rejection and answer it with an error envelope. Retryable
  /// failures release the message id so a redelivery is handled again.
  void reject(process_result_t& out,
              icnp::session::session_t* session,
              const icnp::schema::envelope_t& envelope,
              const icnp::schema::operation_result_t& result,
              icnp::schema::timestamp_milliseconds_t now,
              bool audited = false);

  void audit_rejection(const std::string& session_id,
                       std::vector<std::string> subject_ids,
                       const icnp::schema::operation_result_t& result,
                       icnp::schema::json_t details,
                       icnp::schema::timestamp_milliseconds_t now);

  icnp::schema::json_t make_error_envelope(
      const std::string& session_id,
      const std::optional<icnp::schema::actor_t>& recipient,
      const std::optional<std::string>& related_message_id,
      const icnp::schema::operation_result_t& result,
      icnp::schema::timestamp_milliseconds_t now) const;

  /// True the first time `message_id` is refused for naming no session.
  bool first_orphan_rejection(const std::string& message_id);

  process_result_t dispatch(icnp::session::session_t& session,
                            const icnp::schema::envelope_t& envelope,
                            icnp::schema::timestamp_milliseconds_t now);

  icnp::config::engine_options_t options_;
  icnp::execution::collaborators_t collaborators_;
  icnp::audit::audit_log audit_;
  icnp::session::session_store sessions_;
  icnp::envelope::validator validator_;
  icnp::registry::intent_registry intents_;
  icnp::registry::capability_ledger capabilities_;
  icnp::negotiation::contract_negotiator negotiator_;
  icnp::token::token_issuer issuer_;
  icnp::enforcement::enforcement_gate gate_;

  // Recent message ids refused for naming no session, oldest first.
  std::mutex orphans_mutex_;
  std::unordered_set<std::string> orphan_ids_;
  std::deque<std::string> orphan_order_;
};

}  // namespace icnp::engine
