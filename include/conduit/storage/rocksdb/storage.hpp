#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <conduit/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace conduit::storage {

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final : kv_store {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<conduit::schema::bytes_t> get(
      const conduit::schema::bytes_view_t& key) const override;
  void put(const conduit::schema::bytes_view_t& key,
           const conduit::schema::bytes_view_t& value) override;
  void remove(const conduit::schema::bytes_view_t& key) override;
  std::vector<key_value_entry_t> list_by_prefix(
      const conduit::schema::bytes_view_t& prefix) const override;

  /// Applies the whole batch through one RocksDB WriteBatch.
  void apply(const std::vector<write_operation>& operations) override;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

}  // namespace conduit::storage
