#include <tender/common/critical.hpp>
#include <tender/storage/rocksdb/storage.hpp>

#include <filesystem>
#include <system_error>

namespace tender::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto directory = std::filesystem::path{path};
  if (directory.has_parent_path()) {
    auto error = std::error_code{};
    std::filesystem::create_directories(directory.parent_path(), error);
    if (error) {
      tender::common::critical("cannot create parent of {}: {}", path,
                               error.message());
    }
  }

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();
  options.keep_log_file_num = 4;

  auto* database = static_cast<ROCKSDB_NAMESPACE::DB*>(nullptr);
  auto status = ROCKSDB_NAMESPACE::DB::Open(options, directory.string(),
                                            &database);
  if (!status.ok()) {
    tender::common::critical("cannot open RocksDB at {}: {}", path,
                             status.ToString());
  }

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  spdlog::info("Opened RocksDB at {}", path);
  return store;
}

}  // namespace tender::storage
