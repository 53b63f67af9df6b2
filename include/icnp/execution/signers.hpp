#pragma once

#include <icnp/execution/collaborators.hpp>
#include <icnp/schema/primitives.hpp>

#include <map>
#include <string>

namespace icnp::execution {

inline constexpr auto kHmacSha256Algorithm = std::string_view{"hmac-sha256"};
inline constexpr auto kEd25519Algorithm = std::string_view{"ed25519"};

/// Shared-secret scheme. `keys` maps key id to secret.
token_signer_t make_hmac_sha256_signer(
    std::map<std::string, icnp::schema::bytes_t> keys);

/// `private_keys` maps key id to a 32-byte seed used for signing; their public
/// halves are derived for verification. `public_keys` adds verify-only keys
/// for peers.
token_signer_t make_ed25519_signer(
    std::map<std::string, icnp::schema::bytes_t> private_keys,
    std::map<std::string, icnp::schema::bytes_t> public_keys = {});

}  // namespace icnp::execution
