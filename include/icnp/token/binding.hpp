#pragma once

#include <icnp/canonical/canonicalize.hpp>
#include <icnp/schema/execution_token.hpp>
#include <icnp/schema/primitives.hpp>
#include <icnp/session/session.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace icnp::token {

/// The three documents a token binds, copied out of the session.
struct binding_documents_t final {
  icnp::schema::json_t intent;
  icnp::schema::json_t contract;
  icnp::schema::json_t capabilities;
};

bool is_supported_hash_algorithm(std::string_view algorithm);

/// Hex digest of `bytes` under `algorithm` (`sha256` or `blake3`).
std::optional<std::string> digest_hex(std::string_view algorithm,
                                      const icnp::schema::bytes_view_t& bytes);

/// Disclosed capability documents ordered by capability id, wrapped as
/// `{"capabilities": [...]}`.
icnp::schema::json_t make_capabilities_document(
    const icnp::session::session_t& session);

/// Intent declaration, contract and capability documents as received. Needs
/// a recorded intent and a contract.
std::optional<binding_documents_t> make_binding_documents(
    const icnp::session::session_t& session);

std::optional<icnp::schema::binding_hash_t> hash_document(
    const icnp::schema::json_t& document,
    std::string_view algorithm,
    const icnp::canonical::canonicalizer_t& canonicalizer,
    std::string& error);

std::optional<icnp::schema::token_binding_t> compute_binding(
    const binding_documents_t& documents,
    std::string_view algorithm,
    const icnp::canonical::canonicalizer_t& canonicalizer,
    std::string& error);

}  // namespace icnp::token
