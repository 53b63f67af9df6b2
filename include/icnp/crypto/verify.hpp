#pragma once

#include <icnp/schema/primitives.hpp>

#include <optional>

namespace icnp::crypto {

/// True when the linked OpenSSL provides HMAC-SHA256 and Ed25519.
bool available();

std::optional<icnp::schema::bytes_t> hmac_sha256(
    const icnp::schema::bytes_view_t& key,
    const icnp::schema::bytes_view_t& message);

/// Constant-time comparison against a freshly computed MAC.
bool verify_hmac_sha256(const icnp::schema::bytes_view_t& key,
                        const icnp::schema::bytes_view_t& message,
                        const icnp::schema::bytes_view_t& mac);

/// `private_key` is the 32-byte raw seed.
std::optional<icnp::schema::bytes_t> sign_ed25519(
    const icnp::schema::bytes_view_t& private_key,
    const icnp::schema::bytes_view_t& message);

std::optional<icnp::schema::bytes_t> ed25519_public_key(
    const icnp::schema::bytes_view_t& private_key);

bool verify_ed25519(const icnp::schema::bytes_view_t& public_key,
                    const icnp::schema::bytes_view_t& message,
                    const icnp::schema::bytes_view_t& signature);

}  // namespace icnp::crypto
