#pragma once
#include <conduit/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace conduit::storage {

using key_value_entry_t =
    std::pair<conduit::schema::bytes_t, conduit::schema::bytes_t>;

/// A single buffered mutation; an empty value is a deletion.
struct write_operation final {
  conduit::schema::bytes_t key;
  std::optional<conduit::schema::bytes_t> value;
};

/// Last block the host finalized on top of this store.
struct committed_state final {
  uint16_t version{1};
  uint64_t height{};
  uint64_t time{};
  conduit::schema::hash32_t app_hash{};
};

/// Ordered byte key/value store. Keys compare bytewise.
class kv_store {
 public:
  virtual ~kv_store() = default;

  /// Raw value at key, or std::nullopt when missing.
  virtual std::optional<conduit::schema::bytes_t> get(
      const conduit::schema::bytes_view_t& key) const = 0;

  virtual void put(const conduit::schema::bytes_view_t& key,
                   const conduit::schema::bytes_view_t& value) = 0;

  virtual void remove(const conduit::schema::bytes_view_t& key) = 0;

  /// Return all key-value pairs that share the provided key prefix, in
  /// ascending key order.
  virtual std::vector<key_value_entry_t> list_by_prefix(
      const conduit::schema::bytes_view_t& prefix) const = 0;

  /// Apply a batch of mutations in order. Backends that support it apply
  /// the batch atomically.
  virtual void apply(const std::vector<write_operation>& operations);
};

template <typename Library>
struct storage;

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace conduit::storage
