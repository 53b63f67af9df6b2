#include <icnp/crypto/digest.hpp>

#include <openssl/evp.h>

#include <memory>

#include <icnp/common/critical.hpp>

namespace icnp::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

icnp::schema::hash32_t sha256(const icnp::schema::bytes_view_t& bytes) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  auto output = icnp::schema::hash32_t{};
  auto length = 0u;
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), output.data(), &length) != 1 ||
      length != output.size()) {
    icnp::common::critical("crypto", "OpenSSL SHA-256 digest failed");
  }
  return output;
}

}  // namespace icnp::crypto
