#include <icnp/blake3/hash.hpp>
#include <icnp/config/engine_options.hpp>
#include <icnp/crypto/digest.hpp>
#include <icnp/token/binding.hpp>

#include <algorithm>
#include <iterator>
#include <vector>

using namespace icnp::schema;

namespace icnp::token {

bool is_supported_hash_algorithm(const std::string_view algorithm) {
  return algorithm == icnp::config::kSha256 ||
         algorithm == icnp::config::kBlake3;
}

std::optional<std::string> digest_hex(const std::string_view algorithm,
                                      const bytes_view_t& bytes) {
  if (algorithm == icnp::config::kSha256) {
    const auto digest = icnp::crypto::sha256(bytes);
    return to_hex(digest);
  }
  if (algorithm == icnp::config::kBlake3) {
    const auto digest = icnp::blake3::hash(bytes);
    return to_hex(digest);
  }
  return std::nullopt;
}

json_t make_capabilities_document(const icnp::session::session_t& session) {
  auto ordered = std::vector<const icnp::session::disclosed_capability_t*>{};
  for (const auto& disclosed : session.capabilities) {
    ordered.push_back(&disclosed);
  }
  std::sort(std::begin(ordered), std::end(ordered),
            [](const auto* lhs, const auto* rhs) {
              return lhs->capability.capability_id <
                     rhs->capability.capability_id;
            });
  auto capabilities = json_t::array();
  for (const auto* disclosed : ordered) {
    capabilities.push_back(disclosed->document);
  }
  return json_t{{"capabilities", std::move(capabilities)}};
}

std::optional<binding_documents_t> make_binding_documents(
    const icnp::session::session_t& session) {
  if (!session.intent || !session.contract) {
    return std::nullopt;
  }
  return binding_documents_t{
      .intent = session.intent->document,
      .contract = session.contract->document,
      .capabilities = make_capabilities_document(session)};
}

std::optional<binding_hash_t> hash_document(
    const json_t& document,
    const std::string_view algorithm,
    const icnp::canonical::canonicalizer_t& canonicalizer,
    std::string& error) {
  if (!canonicalizer) {
    error = "no canonicalizer configured";
    return std::nullopt;
  }
  const auto bytes = canonicalizer(document);
  if (!bytes) {
    error = "document has no canonical form";
    return std::nullopt;
  }
  auto value = digest_hex(algorithm, make_bytes_view(*bytes));
  if (!value) {
    error = "unsupported hash algorithm '" + std::string{algorithm} + "'";
    return std::nullopt;
  }
  return binding_hash_t{.alg = std::string{algorithm},
                        .value = std::move(*value)};
}

std::optional<token_binding_t> compute_binding(
    const binding_documents_t& documents,
    const std::string_view algorithm,
    const icnp::canonical::canonicalizer_t& canonicalizer,
    std::string& error) {
  auto intent_hash =
      hash_document(documents.intent, algorithm, canonicalizer, error);
  if (!intent_hash) {
    return std::nullopt;
  }
  auto contract_hash =
      hash_document(documents.contract, algorithm, canonicalizer, error);
  if (!contract_hash) {
    return std::nullopt;
  }
  auto capabilities_hash =
      hash_document(documents.capabilities, algorithm, canonicalizer, error);
  if (!capabilities_hash) {
    return std::nullopt;
  }
  return token_binding_t{.intent_hash = std::move(*intent_hash),
                         .contract_hash = std::move(*contract_hash),
                         .capabilities_hash = std::move(*capabilities_hash)};
}

}  // namespace icnp::token
