#pragma once

#include <icnp/schema/enum_string.hpp>
#include <icnp/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

// Field access helpers shared by the JSON codecs. Every failure throws
// `std::invalid_argument` (or a nlohmann type error); callers decode through
// `encoder<json_encoder_tag>`, which turns both into an error string.
namespace icnp::schema::encoding::json {

inline const json_t& require(const json_t& document, const std::string& key) {
  if (!document.is_object()) {
    throw std::invalid_argument("expected object while reading '" + key + "'");
  }
  const auto it = document.find(key);
  if (it == document.end() || it->is_null()) {
    throw std::invalid_argument("missing field '" + key + "'");
  }
  return *it;
}

inline std::string require_string(const json_t& document,
                                  const std::string& key) {
  const auto& value = require(document, key);
  if (!value.is_string()) {
    throw std::invalid_argument("field '" + key + "' must be a string");
  }
  return value.get<std::string>();
}

template <typename T>
void read_optional(const json_t& document,
                   const std::string& key,
                   std::optional<T>& out) {
  const auto it = document.find(key);
  if (it == document.end() || it->is_null()) {
    out.reset();
    return;
  }
  out = it->template get<T>();
}

/// Reads `key` into `out` when present; leaves the default otherwise.
template <typename T>
void read_or_default(const json_t& document, const std::string& key, T& out) {
  const auto it = document.find(key);
  if (it == document.end() || it->is_null()) {
    return;
  }
  out = it->template get<T>();
}

template <typename T>
void write_optional(json_t& document,
                    const std::string& key,
                    const std::optional<T>& value) {
  if (value) {
    document[key] = *value;
  }
}

/// Non-negative integer that fits in 32 bits, signed or unsigned on the wire.
inline std::optional<uint32_t> try_count_from_json(const json_t& value) {
  if (!value.is_number_integer() || value.get<int64_t>() < 0 ||
      value.get<int64_t>() > static_cast<int64_t>(UINT32_MAX)) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(value.get<int64_t>());
}

inline uint32_t count_from_json(const json_t& value) {
  const auto count = try_count_from_json(value);
  if (!count) {
    throw std::invalid_argument("expected a non-negative 32-bit integer");
  }
  return *count;
}

template <typename Enum>
Enum enum_from_json(const json_t& value) {
  if (!value.is_string()) {
    throw std::invalid_argument("enumeration value must be a string");
  }
  const auto& name = value.get_ref<const std::string&>();
  const auto parsed = try_from_string<Enum>(name);
  if (!parsed) {
    throw std::invalid_argument("unknown enumeration value '" + name + "'");
  }
  return *parsed;
}

}  // namespace icnp::schema::encoding::json
