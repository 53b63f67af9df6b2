#pragma once

#include <icnp/schema/actor.hpp>
#include <icnp/schema/envelope.hpp>
#include <icnp/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace icnp::config {

inline constexpr auto kSha256 = std::string_view{"sha256"};
inline constexpr auto kBlake3 = std::string_view{"blake3"};

/// Deployment parameters of one engine instance.
struct engine_options_t final {
  icnp::schema::actor_t identity{
      .id = "icnp-engine",
      .role = icnp::schema::actor_role_t::orchestrator,
      .display_name = std::nullopt};
  icnp::schema::duration_milliseconds_t negotiation_ttl_ms{300'000};
  icnp::schema::duration_milliseconds_t token_ttl_ms{600'000};
  uint32_t default_max_invocations_per_actor{3};
  // Unset disables the shared total limit.
  std::optional<uint32_t> default_max_invocations_total{20};
  std::string binding_hash_algorithm{kSha256};
  // Zero runs collaborator calls inline without a deadline.
  icnp::schema::duration_milliseconds_t collaborator_timeout_ms{2'000};
  // Threads running collaborator calls that have a deadline.
  uint32_t collaborator_threads{4};
  bool require_full_coverage{};
  // Issue the execution token as soon as a contract is accepted.
  bool auto_issue_token{};
  std::string signing_key_id{"icnp-default"};
  std::string icnp_version{icnp::schema::kIcnpVersion};
};

/// Reject options the engine cannot run with. `error` names the first
/// offending option.
bool validate(const engine_options_t& options, std::string& error);

}  // namespace icnp::config
