#include <spdlog/spdlog.h>
#include <conduit/common/critical.hpp>
#include <conduit/storage/rocksdb/storage.hpp>
#include <string>

namespace conduit::storage {

namespace {

ROCKSDB_NAMESPACE::Slice make_slice(const conduit::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

conduit::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

void ensure_open(const std::unique_ptr<ROCKSDB_NAMESPACE::DB>& database) {
  if (!database) {
    conduit::common::critical("RocksDB database is not initialized");
  }
}

}  // namespace

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
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    conduit::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<conduit::schema::bytes_t> storage<rocksdb_storage_tag>::get(
    const conduit::schema::bytes_view_t& key) const {
  ensure_open(database);
  auto value = std::string{};
  auto status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{}, make_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    conduit::common::critical("Failed to get value from RocksDB");
  }
  return conduit::schema::bytes_t(std::begin(value), std::end(value));
}

void storage<rocksdb_storage_tag>::put(
    const conduit::schema::bytes_view_t& key,
    const conduit::schema::bytes_view_t& value) {
  ensure_open(database);
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              make_slice(key), make_slice(value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    conduit::common::critical("Failed to put value into RocksDB");
  }
}

void storage<rocksdb_storage_tag>::remove(
    const conduit::schema::bytes_view_t& key) {
  ensure_open(database);
  auto status =
      database->Delete(ROCKSDB_NAMESPACE::WriteOptions{}, make_slice(key));
  if (!status.ok()) {
    spdlog::error("Failed to delete key from RocksDB: {}", status.ToString());
    conduit::common::critical("Failed to delete key from RocksDB");
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const conduit::schema::bytes_view_t& prefix) const {
  ensure_open(database);

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = make_slice(prefix);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  for (iterator->Seek(prefix_slice);
       iterator->Valid() && iterator->key().starts_with(prefix_slice);
       iterator->Next()) {
    entries.push_back(
        key_value_entry_t{to_bytes(iterator->key()), to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    conduit::common::critical("RocksDB iteration failed");
  }
  return entries;
}

void storage<rocksdb_storage_tag>::apply(
    const std::vector<write_operation>& operations) {
  ensure_open(database);
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& operation : operations) {
    auto status = operation.value
                      ? batch.Put(make_slice(operation.key),
                                  make_slice(*operation.value))
                      : batch.Delete(make_slice(operation.key));
    if (!status.ok()) {
      conduit::common::critical("failed to stage RocksDB write batch");
    }
  }
  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to write batch into RocksDB: {}", status.ToString());
    conduit::common::critical("Failed to write batch into RocksDB");
  }
}

}  // namespace conduit::storage
