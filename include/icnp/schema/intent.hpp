#pragma once

#include <icnp/schema/enum_string.hpp>
#include <icnp/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: intent.
// Negotiation input: the initiator's goal, the actions it wants performed and
// the constraints every later contract must respect.
namespace icnp::schema {

enum class risk_tolerance_t : uint8_t { none = 0, low = 1, medium = 2, high = 3 };

enum class audit_level_t : uint8_t { minimal = 0, standard = 1, full = 2 };

inline constexpr auto kRiskToleranceMappings = std::array{
    enum_mapping_t<risk_tolerance_t>{"none", risk_tolerance_t::none},
    enum_mapping_t<risk_tolerance_t>{"low", risk_tolerance_t::low},
    enum_mapping_t<risk_tolerance_t>{"medium", risk_tolerance_t::medium},
    enum_mapping_t<risk_tolerance_t>{"high", risk_tolerance_t::high}};

inline constexpr auto kAuditLevelMappings = std::array{
    enum_mapping_t<audit_level_t>{"minimal", audit_level_t::minimal},
    enum_mapping_t<audit_level_t>{"standard", audit_level_t::standard},
    enum_mapping_t<audit_level_t>{"full", audit_level_t::full}};

template <>
inline std::optional<risk_tolerance_t> try_from_string<risk_tolerance_t>(
    const std::string_view value) {
  return from_string(value, kRiskToleranceMappings);
}

template <>
inline std::optional<audit_level_t> try_from_string<audit_level_t>(
    const std::string_view value) {
  return from_string(value, kAuditLevelMappings);
}

inline constexpr std::string_view to_string(const risk_tolerance_t value) {
  return to_string(value, kRiskToleranceMappings).value_or("unknown");
}

inline constexpr std::string_view to_string(const audit_level_t value) {
  return to_string(value, kAuditLevelMappings).value_or("unknown");
}

struct data_policy_t final {
  std::vector<std::string> allowed_data_classes;
  std::optional<uint32_t> retention_days;
};

struct intent_constraints_t final {
  risk_tolerance_t risk_tolerance{risk_tolerance_t::low};
  bool human_approval_required{};
  data_policy_t data_policy;
  bool external_side_effects_allowed{};
  audit_level_t audit_level{audit_level_t::standard};
};

struct requested_action_t final {
  std::string action;
  std::optional<std::string> description;
};

template <uint16_t Version>
struct intent;

template <>
struct intent<1> final {
  uint16_t version{1};
  std::string goal;
  std::vector<requested_action_t> requested_actions;
  std::vector<std::string> expected_outputs;
  intent_constraints_t constraints;
};

using intent_t = intent<1>;

}  // namespace icnp::schema
