#include <cursorctl/common/errors.hpp>
#include <cursorctl/storage/rocksdb/storage.hpp>

#include <filesystem>
#include <system_error>

namespace cursorctl::storage {
template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto parent = std::filesystem::path{path}.parent_path();
  if (!parent.empty()) {
    auto error = std::error_code{};
    std::filesystem::create_directories(parent, error);
    if (error) {
      spdlog::error("Failed to create RocksDB parent directory {}: {}",
                    parent.string(), error.message());
      throw cursorctl::common::storage_error{
          "Failed to create history directory " + parent.string() + ": " +
          error.message()};
    }
  }

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.OptimizeForSmallDb();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    detail::fail("Failed to open RocksDB at " + std::string{path}, status);
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}
}  // namespace cursorctl::storage
