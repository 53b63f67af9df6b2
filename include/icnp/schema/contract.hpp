#pragma once

#include <icnp/schema/actor.hpp>
#include <icnp/schema/enum_string.hpp>
#include <icnp/schema/intent.hpp>
#include <icnp/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: contract.
// Negotiated agreement: which executor may perform which action under which
// capability, what is forbidden regardless, and how violations are handled.
namespace icnp::schema {

enum class enforcement_mode_t : uint8_t {
  strict = 0,
  permissive = 1,
  audit_only = 2
};

enum class violation_action_t : uint8_t {
  deny = 0,
  abort = 1,
  abort_and_rollback = 2
};

enum class approval_decision_t : uint8_t { approve = 0, reject = 1 };

enum class contract_status_t : uint8_t {
  proposed = 0,
  accepted = 1,
  rejected = 2,
  superseded = 3
};

inline constexpr auto kEnforcementModeMappings = std::array{
    enum_mapping_t<enforcement_mode_t>{"strict", enforcement_mode_t::strict},
    enum_mapping_t<enforcement_mode_t>{"permissive",
                                       enforcement_mode_t::permissive},
    enum_mapping_t<enforcement_mode_t>{"audit_only",
                                       enforcement_mode_t::audit_only}};

inline constexpr auto kViolationActionMappings = std::array{
    enum_mapping_t<violation_action_t>{"deny", violation_action_t::deny},
    enum_mapping_t<violation_action_t>{"abort", violation_action_t::abort},
    enum_mapping_t<violation_action_t>{
        "abort_and_rollback", violation_action_t::abort_and_rollback}};

inline constexpr auto kApprovalDecisionMappings = std::array{
    enum_mapping_t<approval_decision_t>{"approve",
                                        approval_decision_t::approve},
    enum_mapping_t<approval_decision_t>{"reject", approval_decision_t::reject}};

inline constexpr auto kContractStatusMappings = std::array{
    enum_mapping_t<contract_status_t>{"proposed", contract_status_t::proposed},
    enum_mapping_t<contract_status_t>{"accepted", contract_status_t::accepted},
    enum_mapping_t<contract_status_t>{"rejected", contract_status_t::rejected},
    enum_mapping_t<contract_status_t>{"superseded",
                                      contract_status_t::superseded}};

template <>
inline std::optional<enforcement_mode_t> try_from_string<enforcement_mode_t>(
    const std::string_view value) {
  return from_string(value, kEnforcementModeMappings);
}

template <>
inline std::optional<violation_action_t> try_from_string<violation_action_t>(
    const std::string_view value) {
  return from_string(value, kViolationActionMappings);
}

template <>
inline std::optional<approval_decision_t> try_from_string<approval_decision_t>(
    const std::string_view value) {
  return from_string(value, kApprovalDecisionMappings);
}

template <>
inline std::optional<contract_status_t> try_from_string<contract_status_t>(
    const std::string_view value) {
  return from_string(value, kContractStatusMappings);
}

inline constexpr std::string_view to_string(const enforcement_mode_t value) {
  return to_string(value, kEnforcementModeMappings).value_or("unknown");
}

inline constexpr std::string_view to_string(const violation_action_t value) {
  return to_string(value, kViolationActionMappings).value_or("unknown");
}

inline constexpr std::string_view to_string(const approval_decision_t value) {
  return to_string(value, kApprovalDecisionMappings).value_or("unknown");
}

inline constexpr std::string_view to_string(const contract_status_t value) {
  return to_string(value, kContractStatusMappings).value_or("unknown");
}

/// Scope values on a forbidden action that match every scope.
inline constexpr auto kWildcardScopes =
    std::array<std::string_view, 2>{"any", "*"};

struct agreed_action_t final {
  std::string action_id;
  std::string capability_id;
  std::string executor_id;
  std::string action;
  std::string scope;
  std::optional<uint32_t> max_invocations;
};

struct forbidden_action_t final {
  std::string action;
  // Absent means every scope.
  std::optional<std::string> scope;
  std::optional<std::string> reason;
};

struct enforcement_t final {
  enforcement_mode_t mode{enforcement_mode_t::strict};
  violation_action_t violation_action{violation_action_t::deny};
  audit_level_t audit_level{audit_level_t::standard};
  bool logging_required{true};
  bool rollback_required{};
};

struct approval_t final {
  actor_t approver;
  approval_decision_t decision{approval_decision_t::approve};
  std::string decided_at;
  std::optional<std::string> note;
};

/// Detached signature. `value` is base64 for binary schemes; `signed_at` is
/// RFC3339.
struct signature_t final {
  std::string alg;
  std::string value;
  std::string key_id;
  std::string signed_by;
  std::string signed_at;

  bool operator==(const signature_t&) const = default;
};

template <uint16_t Version>
struct contract;

template <>
struct contract<1> final {
  uint16_t version{1};
  std::string contract_id;
  std::string session_id;
  std::optional<std::string> issued_at;
  std::vector<actor_t> parties;
  std::vector<agreed_action_t> agreed_actions;
  std::vector<forbidden_action_t> forbidden_actions;
  json_t constraints = json_t::object();
  enforcement_t enforcement;
  std::vector<approval_t> approvals;
  // Keyed by signer id.
  std::map<std::string, signature_t> signatures;
};

using contract_t = contract<1>;

}  // namespace icnp::schema
