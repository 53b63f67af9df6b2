#include <icnp/crypto/verify.hpp>

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include <array>
#include <memory>

namespace icnp::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using evp_mac_ptr = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;
using evp_mac_ctx_ptr =
    std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;

constexpr auto kEd25519KeySize = std::size_t{32};
constexpr auto kEd25519SignatureSize = std::size_t{64};

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx) {
    return false;
  }
  return true;
}

bool openssl_has_hmac() {
  auto mac = evp_mac_ptr{EVP_MAC_fetch(nullptr, "HMAC", nullptr), EVP_MAC_free};
  if (!mac) {
    return false;
  }
  return true;
}

evp_pkey_ptr load_ed25519_private_key(
    const icnp::schema::bytes_view_t& private_key) {
  if (private_key.size() != kEd25519KeySize) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }
  return evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                   private_key.data(), private_key.size()),
      EVP_PKEY_free};
}

}  // namespace

bool available() {
  static const auto available_now = openssl_has_ed25519() && openssl_has_hmac();
  return available_now;
}

std::optional<icnp::schema::bytes_t> hmac_sha256(
    const icnp::schema::bytes_view_t& key,
    const icnp::schema::bytes_view_t& message) {
  auto mac = evp_mac_ptr{EVP_MAC_fetch(nullptr, "HMAC", nullptr), EVP_MAC_free};
  if (!mac) {
    return std::nullopt;
  }
  auto ctx = evp_mac_ctx_ptr{EVP_MAC_CTX_new(mac.get()), EVP_MAC_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }

  auto* digest_name = const_cast<char*>("SHA256");
  auto params = std::array{OSSL_PARAM_construct_utf8_string(
                               OSSL_MAC_PARAM_DIGEST, digest_name, 0),
                           OSSL_PARAM_construct_end()};
  // A zero-length key is legal for HMAC but OpenSSL wants a non-null pointer.
  static const auto kEmptyKey = uint8_t{0};
  const auto* key_data = key.empty() ? &kEmptyKey : key.data();
  if (EVP_MAC_init(ctx.get(), key_data, key.size(), params.data()) != 1 ||
      EVP_MAC_update(ctx.get(), message.data(), message.size()) != 1) {
    return std::nullopt;
  }

  auto output = icnp::schema::bytes_t(EVP_MAX_MD_SIZE);
  auto length = std::size_t{0};
  if (EVP_MAC_final(ctx.get(), output.data(), &length, output.size()) != 1) {
    return std::nullopt;
  }
  output.resize(length);
  return output;
}

bool verify_hmac_sha256(const icnp::schema::bytes_view_t& key,
                        const icnp::schema::bytes_view_t& message,
                        const icnp::schema::bytes_view_t& mac) {
  const auto expected = hmac_sha256(key, message);
  if (!expected || expected->size() != mac.size()) {
    return false;
  }
  return CRYPTO_memcmp(expected->data(), mac.data(), mac.size()) == 0;
}

std::optional<icnp::schema::bytes_t> sign_ed25519(
    const icnp::schema::bytes_view_t& private_key,
    const icnp::schema::bytes_view_t& message) {
  auto pkey = load_ed25519_private_key(private_key);
  if (!pkey) {
    return std::nullopt;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }

  auto signature = icnp::schema::bytes_t(kEd25519SignatureSize);
  auto length = signature.size();
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
          1 ||
      EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(),
                     message.size()) != 1) {
    return std::nullopt;
  }
  signature.resize(length);
  return signature;
}

std::optional<icnp::schema::bytes_t> ed25519_public_key(
    const icnp::schema::bytes_view_t& private_key) {
  auto pkey = load_ed25519_private_key(private_key);
  if (!pkey) {
    return std::nullopt;
  }
  auto public_key = icnp::schema::bytes_t(kEd25519KeySize);
  auto length = public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), public_key.data(), &length) !=
      1) {
    return std::nullopt;
  }
  public_key.resize(length);
  return public_key;
}

bool verify_ed25519(const icnp::schema::bytes_view_t& public_key,
                    const icnp::schema::bytes_view_t& message,
                    const icnp::schema::bytes_view_t& signature) {
  if (public_key.size() != kEd25519KeySize ||
      signature.size() != kEd25519SignatureSize) {
    return false;
  }
  auto pkey =
      evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               public_key.data(),
                                               public_key.size()),
                   EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

}  // namespace icnp::crypto
