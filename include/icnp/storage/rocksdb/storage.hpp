#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <icnp/common/critical.hpp>
#include <icnp/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace icnp::storage {

namespace detail {

inline constexpr auto kComponent = std::string_view{"storage"};

inline icnp::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const icnp::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const icnp::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  bool put_if_absent(Encoder& encoder,
                     const icnp::schema::bytes_view_t& key,
                     const T& value);

  std::vector<key_value_entry_t> list_range(
      const icnp::schema::bytes_view_t& from,
      const icnp::schema::bytes_view_t& to) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const icnp::schema::bytes_view_t& key) const {
  if (!database) {
    icnp::common::critical(detail::kComponent,
                           "RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    icnp::common::critical(detail::kComponent,
                           "Failed to get value from RocksDB");
  }
  return encoder.template try_decode<T>(icnp::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()});
}

// Check-then-write; callers serialize writers of the same key.
template <typename Encoder, typename T>
bool storage<rocksdb_storage_tag>::put_if_absent(
    Encoder& encoder,
    const icnp::schema::bytes_view_t& key,
    const T& value) {
  if (!database) {
    icnp::common::critical(detail::kComponent,
                           "RocksDB database is not initialized");
  }
  auto existing = std::string{};
  auto found = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                             detail::to_slice(key), &existing);
  if (found.ok()) {
    spdlog::warn("Refusing to overwrite existing RocksDB key");
    return false;
  }
  if (!found.IsNotFound()) {
    spdlog::error("Failed to probe RocksDB key: {}", found.ToString());
    return false;
  }

  auto encoded_value = encoder.encode(value);
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Put(
      write_options, detail::to_slice(key),
      detail::to_slice(icnp::schema::make_bytes_view(encoded_value)));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    return false;
  }
  return true;
}

inline std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_range(
    const icnp::schema::bytes_view_t& from,
    const icnp::schema::bytes_view_t& to) const {
  if (!database) {
    icnp::common::critical(detail::kComponent,
                           "RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  const auto upper = detail::to_slice(to);
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  read_options.iterate_upper_bound = &upper;
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  for (iterator->Seek(detail::to_slice(from)); iterator->Valid();
       iterator->Next()) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB range scan failed: {}",
                  iterator->status().ToString());
  }
  return entries;
}

}  // namespace icnp::storage
