#pragma once
#include <conduit/storage/storage.hpp>
#include <map>

namespace conduit::storage {

/// Write buffer layered over another store. Reads see buffered writes first;
/// nothing reaches the parent until commit(). Dropping the cache discards
/// every buffered write, which is how failed invocations are rolled back.
class cache_store final : public kv_store {
 public:
  explicit cache_store(kv_store& parent);

  cache_store(const cache_store&) = delete;
  cache_store& operator=(const cache_store&) = delete;

  std::optional<conduit::schema::bytes_t> get(
      const conduit::schema::bytes_view_t& key) const override;
  void put(const conduit::schema::bytes_view_t& key,
           const conduit::schema::bytes_view_t& value) override;
  void remove(const conduit::schema::bytes_view_t& key) override;
  std::vector<key_value_entry_t> list_by_prefix(
      const conduit::schema::bytes_view_t& prefix) const override;

  /// Flush buffered writes into the parent as one batch.
  void commit();
  void discard();

  std::size_t pending_writes() const { return writes_.size(); }

 private:
  kv_store& parent_;
  std::map<conduit::schema::bytes_t, std::optional<conduit::schema::bytes_t>>
      writes_;
};

/// View of another store with every key namespaced under a fixed prefix.
class prefixed_store final : public kv_store {
 public:
  prefixed_store(kv_store& inner, conduit::schema::bytes_t prefix);

  std::optional<conduit::schema::bytes_t> get(
      const conduit::schema::bytes_view_t& key) const override;
  void put(const conduit::schema::bytes_view_t& key,
           const conduit::schema::bytes_view_t& value) override;
  void remove(const conduit::schema::bytes_view_t& key) override;

  /// Keys are returned without the namespace prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const conduit::schema::bytes_view_t& prefix) const override;

 private:
  conduit::schema::bytes_t make_key(
      const conduit::schema::bytes_view_t& key) const;

  kv_store& inner_;
  conduit::schema::bytes_t prefix_;
};

}  // namespace conduit::storage
