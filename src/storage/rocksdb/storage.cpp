#include <tandem/common/critical.hpp>
#include <tandem/storage/rocksdb/storage.hpp>

namespace tandem::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.OptimizeForSmallDb();

  ROCKSDB_NAMESPACE::DB* raw{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &raw);
  if (!status.ok()) {
    tandem::common::critical("opening RocksDB store at " + std::string{path},
                             status.ToString());
  }

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(raw);
  spdlog::info("Opened shared-account store at {}", path);
  return store;
}

}  // namespace tandem::storage
