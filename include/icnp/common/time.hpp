#pragma once

#include <icnp/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace icnp::common {

/// Wall clock in Unix milliseconds.
schema::timestamp_milliseconds_t now_milliseconds();

/// UTC RFC3339 (`2024-05-01T12:00:00Z`). A fractional part is written only
/// when the instant is not on a whole second, always with three digits.
std::string format_rfc3339(schema::timestamp_milliseconds_t value);

/// Accepts `YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)`. Fractions finer
/// than a millisecond are truncated. Instants before the epoch are refused.
std::optional<schema::timestamp_milliseconds_t> parse_rfc3339(
    std::string_view value);

}  // namespace icnp::common
