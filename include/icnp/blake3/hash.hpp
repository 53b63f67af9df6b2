#pragma once
#include <icnp/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace icnp::blake3 {

icnp::schema::hash32_t hash(const std::string_view& str);
icnp::schema::hash32_t hash(const icnp::schema::bytes_view_t& bytes);

}  // namespace icnp::blake3
