#pragma once

#include <icnp/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: capability.
// Disclosure unit: one participant's offer to perform a set of actions, each
// with its scopes, approval requirement, confidence and side effects.
namespace icnp::schema {

/// Effects value meaning the action has no external side effects.
inline constexpr auto kNoEffects = std::string_view{"none"};

struct capability_action_t final {
  std::string action;
  std::vector<std::string> scopes;
  bool requires_approval{};
  double confidence{};
  std::string effects{kNoEffects};

  bool operator==(const capability_action_t&) const = default;
};

template <uint16_t Version>
struct capability;

template <>
struct capability<1> final {
  uint16_t version{1};
  std::string capability_id;
  std::optional<std::string> name;
  std::optional<std::string> description;
  std::vector<capability_action_t> actions;

  bool operator==(const capability<1>&) const = default;
};

using capability_t = capability<1>;

}  // namespace icnp::schema
