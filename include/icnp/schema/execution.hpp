#pragma once

#include <icnp/schema/actor.hpp>
#include <icnp/schema/enum_string.hpp>
#include <icnp/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace icnp::schema {

enum class execution_status_t : uint8_t { success = 0, failure = 1 };

/// Per-invocation lifecycle tracked by the enforcement gate.
enum class invocation_state_t : uint8_t {
  received = 0,
  validated = 1,
  executing = 2,
  completed = 3,
  failed = 4,
  denied = 5
};

inline constexpr auto kExecutionStatusMappings = std::array{
    enum_mapping_t<execution_status_t>{"success", execution_status_t::success},
    enum_mapping_t<execution_status_t>{"failure", execution_status_t::failure}};

inline constexpr auto kInvocationStateMappings = std::array{
    enum_mapping_t<invocation_state_t>{"received", invocation_state_t::received},
    enum_mapping_t<invocation_state_t>{"validated",
                                       invocation_state_t::validated},
    enum_mapping_t<invocation_state_t>{"executing",
                                       invocation_state_t::executing},
    enum_mapping_t<invocation_state_t>{"completed",
                                       invocation_state_t::completed},
    enum_mapping_t<invocation_state_t>{"failed", invocation_state_t::failed},
    enum_mapping_t<invocation_state_t>{"denied", invocation_state_t::denied}};

template <>
inline std::optional<execution_status_t> try_from_string<execution_status_t>(
    const std::string_view value) {
  return from_string(value, kExecutionStatusMappings);
}

template <>
inline std::optional<invocation_state_t> try_from_string<invocation_state_t>(
    const std::string_view value) {
  return from_string(value, kInvocationStateMappings);
}

inline constexpr std::string_view to_string(const execution_status_t value) {
  return to_string(value, kExecutionStatusMappings).value_or("unknown");
}

inline constexpr std::string_view to_string(const invocation_state_t value) {
  return to_string(value, kInvocationStateMappings).value_or("unknown");
}

template <uint16_t Version>
struct execution_request;

template <>
struct execution_request<1> final {
  uint16_t version{1};
  std::string invocation_id;
  std::string token_id;
  std::string contract_id;
  std::string action;
  actor_t executor;
  std::optional<std::string> scope;
  std::optional<std::string> nonce;
  std::optional<std::string> requested_at;
  json_t parameters = json_t::object();
};

using execution_request_t = execution_request<1>;

template <uint16_t Version>
struct execution_result;

template <>
struct execution_result<1> final {
  uint16_t version{1};
  std::string invocation_id;
  std::string token_id;
  std::string contract_id;
  execution_status_t status{execution_status_t::success};
  std::optional<std::string> started_at;
  std::optional<std::string> ended_at;
  std::optional<json_t> output;
};

using execution_result_t = execution_result<1>;

}  // namespace icnp::schema
