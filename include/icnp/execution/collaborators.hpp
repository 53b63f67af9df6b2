#pragma once

#include <icnp/canonical/canonicalize.hpp>
#include <icnp/execution/worker_pool.hpp>
#include <icnp/schema/audit_event.hpp>
#include <icnp/schema/capability.hpp>
#include <icnp/schema/primitives.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace icnp::execution {

/// Signing scheme for execution tokens and contract signatures. `key_ref`
/// names the key (the `key_id` carried in the signature object).
struct token_signer_t final {
  std::string algorithm;
  std::function<std::optional<icnp::schema::bytes_t>(
      const icnp::schema::bytes_view_t& message,
      const std::string& key_ref)>
      sign;
  std::function<bool(const icnp::schema::bytes_view_t& message,
                     const icnp::schema::bytes_view_t& signature,
                     const std::string& key_ref)>
      verify;
};

enum class rollback_status_t : uint8_t { ok = 0, error = 1 };

using rollback_executor_t =
    std::function<rollback_status_t(const std::string& invocation_id)>;

/// Match quality of one capability action for a requested action, in [0, 1].
/// Zero means no match.
using capability_scorer_t =
    std::function<double(std::string_view requested_action,
                         const icnp::schema::capability_action_t& offered)>;

using time_source_t = std::function<icnp::schema::timestamp_milliseconds_t()>;

/// Durable audit persistence. Returns false when the event was not stored.
using audit_sink_t =
    std::function<bool(const icnp::schema::audit_event_t& event)>;

struct collaborators_t final {
  token_signer_t signer;
  icnp::canonical::canonicalizer_t canonicalizer;
  rollback_executor_t rollback;
  capability_scorer_t scorer;
  time_source_t clock;
  audit_sink_t audit_sink;
  // Runs calls that have a deadline. The engine starts one when unset.
  std::shared_ptr<worker_pool> workers;
};

/// Exact action-name match weighted by the offered confidence.
capability_scorer_t make_exact_match_scorer();

/// Wall clock, default canonicalizer, exact-match scorer and a rollback
/// executor that reports failure. No signer and no durable audit sink.
collaborators_t make_default_collaborators();

}  // namespace icnp::execution
