#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>
#include <courier/common/critical.hpp>
#include <courier/storage/rocksdb/storage.hpp>

namespace {

// Ledger reads are point lookups on SCALE-encoded keys plus short prefix scans;
// writes arrive as one batch per committed transaction.
ROCKSDB_NAMESPACE::Options make_ledger_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.OptimizeLevelStyleCompaction();

  auto table_options = ROCKSDB_NAMESPACE::BlockBasedTableOptions{};
  table_options.filter_policy.reset(
      ROCKSDB_NAMESPACE::NewBloomFilterPolicy(10, false));
  table_options.whole_key_filtering = true;
  options.table_factory.reset(
      ROCKSDB_NAMESPACE::NewBlockBasedTableFactory(table_options));
  return options;
}

}  // namespace

namespace courier::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::Open(make_ledger_options(),
                                            std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Cannot open ledger store at {}: {}", path,
                  status.ToString());
    courier::common::critical("cannot open ledger store");
  }

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);

  auto checkpoint = store.load_committed_state();
  if (checkpoint.has_value()) {
    spdlog::info("Opened ledger store at {} (committed height {})", path,
                 checkpoint->height);
  } else {
    spdlog::info("Opened empty ledger store at {}", path);
  }
  return store;
}

}  // namespace courier::storage
