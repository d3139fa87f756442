#include <agora/common/critical.hpp>
#include <agora/storage/rocksdb/storage.hpp>
#include <spdlog/spdlog.h>

namespace agora::storage {

namespace {

ROCKSDB_NAMESPACE::Options state_database_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();
  return options;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::Open(state_database_options(),
                                            std::string{path}, &database);
  if (!status.ok()) {
    agora::common::critical("Failed to open state database at {}: {}", path,
                            status.ToString());
  }
  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  if (auto committed = store.load_committed_state()) {
    spdlog::info("Opened state database at {} (committed height {})", path,
                 committed->height);
  } else {
    spdlog::info("Opened empty state database at {}", path);
  }
  return store;
}

}  // namespace agora::storage
