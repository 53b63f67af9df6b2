#pragma once

#include <icnp/audit/audit_log.hpp>
#include <icnp/config/engine_options.hpp>
#include <icnp/execution/collaborators.hpp>
#include <icnp/schema/actor.hpp>
#include <icnp/schema/contract.hpp>
#include <icnp/schema/execution_token.hpp>
#include <icnp/schema/operation_result.hpp>
#include <icnp/schema/primitives.hpp>
#include <icnp/session/session.hpp>
#include <icnp/session/session_store.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace icnp::token {

/// Issues the execution token of an accepted contract and owns its
/// invocation counters.
class token_issuer final {
 public:
  token_issuer(icnp::audit::audit_log& audit,
               icnp::session::session_store& sessions,
               const icnp::config::engine_options_t& options,
               const icnp::execution::collaborators_t& collaborators);

  /// Issue and sign the session token. The approval gate runs first, then
  /// the phase and acceptance preconditions. Moves contract -> token.
  icnp::schema::operation_result_t issue(
      icnp::session::session_t& session,
      const icnp::schema::actor_t& issuer,
      icnp::schema::timestamp_milliseconds_t now,
      icnp::schema::execution_token_t& out);

  /// Adopt a token issued by a peer. `document` is the token object as
  /// received; its signature covers every other member.
  icnp::schema::operation_result_t accept_external(
      icnp::session::session_t& session,
      const icnp::schema::execution_token_t& token,
      const icnp::schema::json_t& document,
      icnp::schema::timestamp_milliseconds_t now);

  /// Validity window, revocation and signature, with the precise reason.
  icnp::schema::operation_result_t check(
      const icnp::session::issued_token_t& issued,
      icnp::schema::timestamp_milliseconds_t now) const;

  /// True iff `not_before <= now < not_after`, the signature verifies and
  /// the token is not revoked.
  bool validate(const icnp::session::issued_token_t& issued,
                icnp::schema::timestamp_milliseconds_t now) const;

  icnp::schema::operation_result_t revoke(
      icnp::session::session_t& session,
      std::string_view token_id,
      const std::optional<std::string>& reason,
      icnp::schema::timestamp_milliseconds_t now);

  /// The session token when its id is `token_id`.
  static std::shared_ptr<icnp::session::issued_token_t> resolve(
      const icnp::session::session_t& session,
      std::string_view token_id);

  /// Reserve one invocation of `agreed` for `actor_id`. Refuses without
  /// touching any counter when the per-actor, per-action or total limit is
  /// already reached.
  icnp::schema::operation_result_t try_consume(
      icnp::session::session_t& session,
      icnp::session::issued_token_t& issued,
      const icnp::schema::agreed_action_t& agreed,
      const std::string& actor_id) const;

 private:
  std::optional<icnp::schema::bytes_t> canonical_bytes(
      const std::string& name,
      const icnp::schema::json_t& document) const;

  std::optional<bool> verify(const icnp::schema::bytes_t& body,
                             const icnp::schema::signature_t& signature) const;

  icnp::audit::audit_log& audit_;
  icnp::session::session_store& sessions_;
  const icnp::config::engine_options_t& options_;
  const icnp::execution::collaborators_t& collaborators_;
};

}  // namespace icnp::token
