#pragma once

#include <icnp/schema/actor.hpp>
#include <icnp/schema/contract.hpp>
#include <icnp/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: execution token.
// Signed attestation binding a session to its accepted contract, with a
// validity window and invocation limits.
namespace icnp::schema {

/// Revocation method advertised when none was negotiated.
inline constexpr auto kOutOfBandRevocation = std::string_view{"out_of_band"};

/// Half-open window `[not_before, not_after)`.
struct token_validity_t final {
  timestamp_milliseconds_t not_before{};
  timestamp_milliseconds_t not_after{};

  bool operator==(const token_validity_t&) const = default;
};

struct token_limits_t final {
  std::optional<uint32_t> max_invocations_total;
  uint32_t max_invocations_per_actor{};

  bool operator==(const token_limits_t&) const = default;
};

struct binding_hash_t final {
  std::string alg;
  // Lowercase hex.
  std::string value;

  bool operator==(const binding_hash_t&) const = default;
};

struct token_binding_t final {
  binding_hash_t intent_hash;
  binding_hash_t contract_hash;
  binding_hash_t capabilities_hash;

  bool operator==(const token_binding_t&) const = default;
};

template <uint16_t Version>
struct execution_token;

template <>
struct execution_token<1> final {
  uint16_t version{1};
  std::string token_id;
  std::string session_id;
  std::string contract_id;
  actor_t issuer;
  std::vector<actor_t> audience;
  timestamp_milliseconds_t issued_at{};
  token_validity_t validity;
  token_limits_t limits;
  token_binding_t binding;
  std::string revocation_method{kOutOfBandRevocation};
  std::optional<signature_t> signature;
};

using execution_token_t = execution_token<1>;

}  // namespace icnp::schema
