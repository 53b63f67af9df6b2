#pragma once

#include <icnp/schema/primitives.hpp>

namespace icnp::crypto {

icnp::schema::hash32_t sha256(const icnp::schema::bytes_view_t& bytes);

}  // namespace icnp::crypto
