#include <icnp/crypto/verify.hpp>
#include <icnp/execution/signers.hpp>

#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

namespace icnp::execution {

token_signer_t make_hmac_sha256_signer(
    std::map<std::string, icnp::schema::bytes_t> keys) {
  auto keyring =
      std::make_shared<const std::map<std::string, icnp::schema::bytes_t>>(
          std::move(keys));

  auto signer = token_signer_t{};
  signer.algorithm = std::string{kHmacSha256Algorithm};
  signer.sign = [keyring](const icnp::schema::bytes_view_t& message,
                          const std::string& key_ref)
      -> std::optional<icnp::schema::bytes_t> {
    const auto it = keyring->find(key_ref);
    if (it == keyring->end()) {
      spdlog::warn("HMAC signing key '{}' is not configured", key_ref);
      return std::nullopt;
    }
    return icnp::crypto::hmac_sha256(icnp::schema::make_bytes_view(it->second),
                                     message);
  };
  signer.verify = [keyring](const icnp::schema::bytes_view_t& message,
                            const icnp::schema::bytes_view_t& signature,
                            const std::string& key_ref) {
    const auto it = keyring->find(key_ref);
    if (it == keyring->end()) {
      spdlog::debug("HMAC verification key '{}' is not configured", key_ref);
      return false;
    }
    return icnp::crypto::verify_hmac_sha256(
        icnp::schema::make_bytes_view(it->second), message, signature);
  };
  return signer;
}

token_signer_t make_ed25519_signer(
    std::map<std::string, icnp::schema::bytes_t> private_keys,
    std::map<std::string, icnp::schema::bytes_t> public_keys) {
  for (const auto& [key_id, seed] : private_keys) {
    auto derived =
        icnp::crypto::ed25519_public_key(icnp::schema::make_bytes_view(seed));
    if (!derived) {
      spdlog::warn("Ed25519 key '{}' is not a valid 32-byte seed", key_id);
      continue;
    }
    public_keys.insert_or_assign(key_id, std::move(*derived));
  }
  auto signing_keys =
      std::make_shared<const std::map<std::string, icnp::schema::bytes_t>>(
          std::move(private_keys));
  auto verifying_keys =
      std::make_shared<const std::map<std::string, icnp::schema::bytes_t>>(
          std::move(public_keys));

  auto signer = token_signer_t{};
  signer.algorithm = std::string{kEd25519Algorithm};
  signer.sign = [signing_keys](const icnp::schema::bytes_view_t& message,
                               const std::string& key_ref)
      -> std::optional<icnp::schema::bytes_t> {
    const auto it = signing_keys->find(key_ref);
    if (it == signing_keys->end()) {
      spdlog::warn("Ed25519 signing key '{}' is not configured", key_ref);
      return std::nullopt;
    }
    return icnp::crypto::sign_ed25519(icnp::schema::make_bytes_view(it->second),
                                      message);
  };
  signer.verify = [verifying_keys](const icnp::schema::bytes_view_t& message,
                                   const icnp::schema::bytes_view_t& signature,
                                   const std::string& key_ref) {
    const auto it = verifying_keys->find(key_ref);
    if (it == verifying_keys->end()) {
      spdlog::debug("Ed25519 verification key '{}' is not configured",
                    key_ref);
      return false;
    }
    return icnp::crypto::verify_ed25519(
        icnp::schema::make_bytes_view(it->second), message, signature);
  };
  return signer;
}

}  // namespace icnp::execution
