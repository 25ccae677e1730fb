#include <waybill/common/critical.hpp>
#include <waybill/storage/rocksdb/storage.hpp>

namespace waybill::storage {
template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    waybill::common::critical("Failed to open RocksDB at {}: {}", path,
                              status.ToString());
  }
  store.database.reset(database);
  store.last_event_ordinal = store.load_last_ordinal(log_channel::events);
  store.last_counter_ordinal = store.load_last_ordinal(log_channel::counters);
  spdlog::info("Successfully opened RocksDB at {} ({} event record(s))", path,
               store.last_event_ordinal);

  return store;
}
}  // namespace waybill::storage
