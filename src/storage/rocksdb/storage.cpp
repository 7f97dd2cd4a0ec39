#include <tentacle/common/critical.hpp>
#include <tentacle/storage/rocksdb/storage.hpp>

namespace tentacle::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.IncreaseParallelism();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    tentacle::common::critical("Failed to open lock state at {}: {}", path,
                               status.ToString());
  }

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  if (auto committed = store.load_committed_state()) {
    spdlog::info("Opened lock state at {} (sequence {})", path,
                 committed->sequence);
  } else {
    spdlog::info("Created empty lock state at {}", path);
  }
  return store;
}

}  // namespace tentacle::storage
