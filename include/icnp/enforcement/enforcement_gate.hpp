#pragma once

#include <icnp/audit/audit_log.hpp>
#include <icnp/config/engine_options.hpp>
#include <icnp/execution/collaborators.hpp>
#include <icnp/schema/actor.hpp>
#include <icnp/schema/contract.hpp>
#include <icnp/schema/execution.hpp>
#include <icnp/schema/operation_result.hpp>
#include <icnp/schema/primitives.hpp>
#include <icnp/session/session.hpp>
#include <icnp/session/session_store.hpp>
#include <icnp/token/token_issuer.hpp>

#include <string>

namespace icnp::enforcement {

/// Outcome of one governed execution request.
struct execution_decision_t final {
  std::string invocation_id;
  // The invocation may run. True for violations under permissive and
  // audit-only enforcement.
  bool allowed{};
  bool violation{};
  bool rolled_back{};
  bool session_aborted{};
  // First failed check, or success.
  icnp::schema::operation_result_t result;
};

/// Checks each execution request against the session token and the frozen
/// contract, then applies the contract's enforcement mode.
///
/// Checks run in order: replay, token resolution and validity, token and
/// session binding, authorization under forbidden-action dominance with
/// audience membership, and finally invocation limits. The first failure is
/// the violation reported.
class enforcement_gate final {
 public:
  enforcement_gate(icnp::audit::audit_log& audit,
                   icnp::session::session_store& sessions,
                   icnp::token::token_issuer& issuer,
                   const icnp::config::engine_options_t& options,
                   const icnp::execution::collaborators_t& collaborators);

  execution_decision_t evaluate(icnp::session::session_t& session,
                                const icnp::schema::execution_request_t& request,
                                icnp::schema::timestamp_milliseconds_t now);

  /// Close an executing invocation with the executor's reported outcome.
  icnp::schema::operation_result_t complete(
      icnp::session::session_t& session,
      const icnp::schema::actor_t& reporter,
      const icnp::schema::execution_result_t& result,
      icnp::schema::timestamp_milliseconds_t now);

 private:
  icnp::schema::operation_result_t check(
      icnp::session::session_t& session,
      const icnp::schema::execution_request_t& request,
      icnp::schema::timestamp_milliseconds_t now);

  void deny(icnp::session::session_t& session,
            const icnp::schema::execution_request_t& request,
            execution_decision_t& decision,
            icnp::schema::timestamp_milliseconds_t now);

  void roll_back(icnp::session::session_t& session,
                 const icnp::schema::execution_request_t& request,
                 execution_decision_t& decision,
                 icnp::schema::timestamp_milliseconds_t now);

  void start(icnp::session::session_t& session,
             const icnp::schema::execution_request_t& request,
             execution_decision_t& decision,
             icnp::schema::timestamp_milliseconds_t now);

  icnp::audit::audit_log& audit_;
  icnp::session::session_store& sessions_;
  icnp::token::token_issuer& issuer_;
  const icnp::config::engine_options_t& options_;
  const icnp::execution::collaborators_t& collaborators_;
};

}  // namespace icnp::enforcement
