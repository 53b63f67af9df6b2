#include <blake3.h>
#include <icnp/blake3/hash.hpp>

namespace icnp::blake3 {

namespace {

icnp::schema::hash32_t finalize(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  // BLAKE3_OUT_LEN
  auto output = icnp::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

icnp::schema::hash32_t hash(const std::string_view& str) {
  return finalize(str.data(), str.size());
}

icnp::schema::hash32_t hash(const icnp::schema::bytes_view_t& bytes) {
  return finalize(bytes.data(), bytes.size());
}

}  // namespace icnp::blake3
