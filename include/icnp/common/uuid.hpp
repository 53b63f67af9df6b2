#pragma once

#include <string>
#include <string_view>

namespace icnp::common {

/// Random RFC4122 version 4 UUID in canonical lowercase text form.
std::string make_uuid();

/// True for the canonical 8-4-4-4-12 hex form. Version and variant nibbles are
/// not checked; peers may use any UUID version.
bool is_uuid(std::string_view value);

}  // namespace icnp::common
