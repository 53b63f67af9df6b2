#pragma once

#include <icnp/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace icnp::schema {

enum class actor_role_t : uint8_t {
  orchestrator = 0,
  agent = 1,
  tool = 2,
  service = 3,
  user = 4
};

inline constexpr auto kActorRoleMappings = std::array{
    enum_mapping_t<actor_role_t>{"orchestrator", actor_role_t::orchestrator},
    enum_mapping_t<actor_role_t>{"agent", actor_role_t::agent},
    enum_mapping_t<actor_role_t>{"tool", actor_role_t::tool},
    enum_mapping_t<actor_role_t>{"service", actor_role_t::service},
    enum_mapping_t<actor_role_t>{"user", actor_role_t::user}};

template <>
inline std::optional<actor_role_t> try_from_string<actor_role_t>(
    const std::string_view value) {
  return from_string(value, kActorRoleMappings);
}

inline constexpr std::string_view to_string(const actor_role_t value) {
  return to_string(value, kActorRoleMappings).value_or("unknown");
}

/// Sender, recipient, party, approver or token audience member.
struct actor_t final {
  std::string id;
  actor_role_t role{actor_role_t::agent};
  std::optional<std::string> display_name;

  bool operator==(const actor_t&) const = default;
};

}  // namespace icnp::schema
