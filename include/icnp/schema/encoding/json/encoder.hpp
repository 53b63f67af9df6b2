#pragma once

#include <icnp/common/critical.hpp>
#include <icnp/schema/encoding/encoder.hpp>
#include <icnp/schema/encoding/json/actor.hpp>
#include <icnp/schema/encoding/json/audit_event.hpp>
#include <icnp/schema/encoding/json/capability.hpp>
#include <icnp/schema/encoding/json/contract.hpp>
#include <icnp/schema/encoding/json/envelope.hpp>
#include <icnp/schema/encoding/json/execution.hpp>
#include <icnp/schema/encoding/json/execution_token.hpp>
#include <icnp/schema/encoding/json/intent.hpp>
#include <icnp/schema/encoding/json/payload.hpp>
#include <icnp/schema/encoding/json/primitives.hpp>
#include <exception>
#include <iterator>
#include <string>
#include <utility>

namespace icnp::schema::encoding {

struct json_encoder_tag {};

template <>
struct encoder<json_encoder_tag> final {
  template <typename T>
  icnp::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, icnp::schema::bytes_t& out);

  template <typename T>
  T decode(const icnp::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const icnp::schema::bytes_view_t& bytes);

  template <typename T>
  icnp::schema::json_t to_document(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const icnp::schema::json_t& document,
                              std::string& error);
};

template <typename T>
icnp::schema::bytes_t encoder<json_encoder_tag>::encode(const T& obj) {
  return icnp::schema::make_bytes(to_document(obj).dump());
}

template <typename T>
void encoder<json_encoder_tag>::encode(const T& obj,
                                       icnp::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<json_encoder_tag>::decode(const icnp::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    icnp::common::critical("json", "failed to decode JSON bytes");
  }
  return std::move(decoded.value());
}

template <typename T>
std::optional<T> encoder<json_encoder_tag>::try_decode(
    const icnp::schema::bytes_view_t& bytes) {
  auto document = icnp::schema::json_t::parse(std::begin(bytes),
                                              std::end(bytes), nullptr, false);
  if (document.is_discarded()) {
    return std::nullopt;
  }
  auto error = std::string{};
  return try_decode<T>(document, error);
}

template <typename T>
icnp::schema::json_t encoder<json_encoder_tag>::to_document(const T& obj) {
  auto document = icnp::schema::json_t{};
  to_json(document, obj);
  return document;
}

template <typename T>
std::optional<T> encoder<json_encoder_tag>::try_decode(
    const icnp::schema::json_t& document,
    std::string& error) {
  try {
    auto result = T{};
    from_json(document, result);
    return result;
  } catch (const std::exception& e) {
    error = e.what();
    return std::nullopt;
  }
}

}  // namespace icnp::schema::encoding
