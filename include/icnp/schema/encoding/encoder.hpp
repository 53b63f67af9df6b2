#pragma once

#include <icnp/schema/primitives.hpp>

#include <optional>
#include <span>

namespace icnp::schema::encoding {

/// Encoding backend selected at build time by tag, e.g.
/// `encoder<json_encoder_tag>`.
template <typename Library>
struct encoder {
  template <typename T>
  icnp::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, icnp::schema::bytes_t& out);

  template <typename T>
  T decode(const icnp::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const icnp::schema::bytes_view_t& bytes);
};

}  // namespace icnp::schema::encoding
