#pragma once

#include <icnp/schema/error_code.hpp>

#include <cstdint>
#include <string>
#include <utility>

namespace icnp::schema {

template <uint16_t Version>
struct operation_result;

/// Outcome of one engine operation. `code == 0` is success; otherwise `code`
/// holds a `negotiation_error_code` and `error` its protocol class.
template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  error_class_t error{error_class_t::none};
  bool retryable{};
  std::string log;
  std::string info;
  std::string codespace;

  bool ok() const { return code == 0; }
};

using operation_result_t = operation_result<1>;

inline operation_result_t make_success(std::string info = {}) {
  auto result = operation_result_t{};
  result.info = std::move(info);
  return result;
}

inline operation_result_t make_failure(const negotiation_error_code code,
                                       const error_class_t error,
                                       std::string log,
                                       std::string info,
                                       std::string codespace,
                                       const bool retryable = false) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.error = error;
  result.retryable = retryable;
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::move(codespace);
  return result;
}

}  // namespace icnp::schema
