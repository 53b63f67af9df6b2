#include <icnp/canonical/canonicalize.hpp>

#include <cmath>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace icnp::canonical {

namespace {

// nlohmann::json keeps object members in a std::map, which yields the sorted
// member order.
nlohmann::json to_sorted(const icnp::schema::json_t& value) {
  switch (value.type()) {
    case icnp::schema::json_t::value_t::object: {
      auto result = nlohmann::json::object();
      for (const auto& [key, member] : value.items()) {
        result[key] = to_sorted(member);
      }
      return result;
    }
    case icnp::schema::json_t::value_t::array: {
      auto result = nlohmann::json::array();
      for (const auto& element : value) {
        result.push_back(to_sorted(element));
      }
      return result;
    }
    case icnp::schema::json_t::value_t::string:
      return value.get<std::string>();
    case icnp::schema::json_t::value_t::boolean:
      return value.get<bool>();
    case icnp::schema::json_t::value_t::number_integer:
      return value.get<int64_t>();
    case icnp::schema::json_t::value_t::number_unsigned:
      return value.get<uint64_t>();
    case icnp::schema::json_t::value_t::number_float: {
      const auto number = value.get<double>();
      if (!std::isfinite(number)) {
        throw std::invalid_argument("non-finite number has no canonical form");
      }
      return number;
    }
    case icnp::schema::json_t::value_t::null:
      return nullptr;
    case icnp::schema::json_t::value_t::binary:
    case icnp::schema::json_t::value_t::discarded:
    default:
      throw std::invalid_argument("value has no canonical JSON form");
  }
}

}  // namespace

std::optional<icnp::schema::bytes_t> canonicalize(
    const icnp::schema::json_t& document,
    std::string& error) {
  try {
    const auto text = to_sorted(document).dump(
        -1, ' ', false, nlohmann::json::error_handler_t::strict);
    return icnp::schema::make_bytes(text);
  } catch (const std::exception& e) {
    error = e.what();
    return std::nullopt;
  }
}

canonicalizer_t make_default_canonicalizer() {
  return [](const icnp::schema::json_t& document)
             -> std::optional<icnp::schema::bytes_t> {
    auto error = std::string{};
    auto result = canonicalize(document, error);
    if (!result) {
      spdlog::warn("Canonicalization failed: {}", error);
    }
    return result;
  };
}

}  // namespace icnp::canonical
