#pragma once

#include <icnp/schema/actor.hpp>
#include <icnp/schema/message_type.hpp>
#include <icnp/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: message envelope.
// Transport-neutral wrapper around every protocol payload. `trace` and
// `extensions` are relayed untouched and never interpreted.
namespace icnp::schema {

inline constexpr auto kIcnpVersion = std::string_view{"1.0.0"};

template <uint16_t Version>
struct envelope;

template <>
struct envelope<1> final {
  uint16_t version{1};
  std::string icnp_version{kIcnpVersion};
  message_type_t type{message_type_t::intent_declaration};
  message_phase_t phase{message_phase_t::intent};
  std::string message_id;
  std::string session_id;
  // RFC3339, kept as received.
  std::string timestamp;
  actor_t sender;
  std::optional<actor_t> recipient;
  std::optional<std::string> in_reply_to;
  std::optional<json_t> trace;
  json_t payload = json_t::object();
  std::optional<json_t> extensions;
};

using envelope_t = envelope<1>;

}  // namespace icnp::schema
