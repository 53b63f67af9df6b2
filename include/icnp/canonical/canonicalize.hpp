#pragma once

#include <icnp/schema/primitives.hpp>

#include <functional>
#include <optional>
#include <string>

namespace icnp::canonical {

/// Document-to-bytes strategy used for binding hashes and token signatures.
/// Equivalent documents must map to identical bytes; `std::nullopt` means the
/// document has no canonical form.
using canonicalizer_t =
    std::function<std::optional<icnp::schema::bytes_t>(
        const icnp::schema::json_t& document)>;

/// Default canonical form: object members sorted by key (byte order), no
/// insignificant whitespace, strings as UTF-8 without escaping non-ASCII,
/// numbers in shortest round-trip form. Non-finite numbers, binary values and
/// invalid UTF-8 are refused, with the reason in `error`.
std::optional<icnp::schema::bytes_t> canonicalize(
    const icnp::schema::json_t& document,
    std::string& error);

canonicalizer_t make_default_canonicalizer();

}  // namespace icnp::canonical
