#pragma once
#include <conduit/common/critical.hpp>
#include <conduit/schema/encoding/scale/encoder.hpp>
#include <conduit/schema/key/builder.hpp>
#include <conduit/storage/storage.hpp>
#include <spdlog/fmt/fmt.h>
#include <optional>
#include <string>
#include <string_view>

namespace conduit::storage {

/// A single SCALE encoded value stored under a fixed key.
template <typename T>
class item final {
 public:
  explicit item(const std::string_view key)
      : key_{conduit::schema::key::builder{}.write(key).data} {}

  std::optional<T> may_load(const kv_store& store) const {
    auto raw = store.get(key_);
    if (!raw) {
      return std::nullopt;
    }
    auto encoder = conduit::schema::encoding::scale_encoder_t{};
    return encoder.decode<T>(*raw);
  }

  /// Value that must exist once the owning contract is instantiated.
  T load(const kv_store& store) const {
    auto value = may_load(store);
    if (!value) {
      conduit::common::critical(
          fmt::format("missing required state item '{}'",
                      conduit::schema::make_string_view(key_)));
    }
    return std::move(*value);
  }

  void save(kv_store& store, const T& value) const {
    auto encoder = conduit::schema::encoding::scale_encoder_t{};
    store.put(key_, encoder.encode(value));
  }

  void remove(kv_store& store) const { store.remove(key_); }

  bool exists(const kv_store& store) const {
    return store.get(key_).has_value();
  }

 private:
  conduit::schema::bytes_t key_;
};

}  // namespace conduit::storage
