#pragma once
#include <icnp/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace icnp::storage {

using key_value_entry_t =
    std::pair<icnp::schema::bytes_t, icnp::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const icnp::schema::bytes_view_t& key) const;

  /// Encode and persist value at key unless the key already holds a value.
  ///
  /// Returns false, leaving the stored value untouched, when the key exists.
  template <typename Encoder, typename T>
  bool put_if_absent(Encoder& encoder,
                     const icnp::schema::bytes_view_t& key,
                     const T& value);

  /// Return key-value pairs with `from <= key < to`, in key order.
  std::vector<key_value_entry_t> list_range(
      const icnp::schema::bytes_view_t& from,
      const icnp::schema::bytes_view_t& to) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace icnp::storage
