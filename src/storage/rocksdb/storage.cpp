#include <icnp/common/critical.hpp>
#include <icnp/storage/rocksdb/storage.hpp>

namespace icnp::storage {

namespace {

// Audit keys are written once, in increasing order, and read back in ranges.
ROCKSDB_NAMESPACE::Options make_journal_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.keep_log_file_num = 4;
  options.IncreaseParallelism(2);
  options.OptimizeLevelStyleCompaction();
  return options;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  ROCKSDB_NAMESPACE::DB* database{nullptr};
  const auto status = ROCKSDB_NAMESPACE::DB::Open(
      make_journal_options(), std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Cannot open audit journal at {}: {}", path,
                  status.ToString());
    icnp::common::critical(detail::kComponent, "audit journal unavailable");
  }

  auto journal = storage<rocksdb_storage_tag>{};
  journal.database.reset(database);
  spdlog::info("Audit journal open at {}", path);
  return journal;
}

}  // namespace icnp::storage
