#pragma once
#include <conduit/schema/encoding/scale/encoder.hpp>
#include <conduit/schema/key/builder.hpp>
#include <conduit/storage/storage.hpp>
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace conduit::storage {

namespace detail {

inline void write_map_key(conduit::schema::key::builder& builder,
                          const std::string& key) {
  builder.write(key);
}

inline void write_map_key(conduit::schema::key::builder& builder,
                          const uint64_t key) {
  builder.write_ordered(key);
}

template <typename Key>
std::optional<Key> read_map_key(const conduit::schema::bytes_view_t& bytes);

template <>
inline std::optional<std::string> read_map_key<std::string>(
    const conduit::schema::bytes_view_t& bytes) {
  return conduit::schema::make_string(bytes);
}

template <>
inline std::optional<uint64_t> read_map_key<uint64_t>(
    const conduit::schema::bytes_view_t& bytes) {
  return conduit::schema::key::read_ordered<uint64_t>(bytes);
}

}  // namespace detail

/// Keyed collection of SCALE encoded values sharing a namespace. String keys
/// are stored raw and integer keys big endian, so iteration follows key order.
template <typename Key, typename T>
class map final {
 public:
  using entry_t = std::pair<Key, T>;

  explicit map(const std::string_view name)
      : prefix_{conduit::schema::key::builder{}.write(name).write("|").data} {}

  std::optional<T> may_load(const kv_store& store, const Key& key) const {
    auto raw = store.get(make_key(key));
    if (!raw) {
      return std::nullopt;
    }
    auto encoder = conduit::schema::encoding::scale_encoder_t{};
    return encoder.decode<T>(*raw);
  }

  bool has(const kv_store& store, const Key& key) const {
    return store.get(make_key(key)).has_value();
  }

  void save(kv_store& store, const Key& key, const T& value) const {
    auto encoder = conduit::schema::encoding::scale_encoder_t{};
    store.put(make_key(key), encoder.encode(value));
  }

  void remove(kv_store& store, const Key& key) const {
    store.remove(make_key(key));
  }

  /// Ascending entries strictly after start_after, at most limit of them.
  std::vector<entry_t> range(const kv_store& store,
                             const std::optional<Key>& start_after,
                             const std::optional<std::size_t>& limit) const {
    auto encoder = conduit::schema::encoding::scale_encoder_t{};
    auto entries = std::vector<entry_t>{};
    for (const auto& [raw_key, raw_value] : store.list_by_prefix(prefix_)) {
      if (limit && entries.size() >= *limit) {
        break;
      }
      auto suffix = conduit::schema::bytes_view_t{raw_key}.subspan(prefix_.size());
      auto key = detail::read_map_key<Key>(suffix);
      if (!key) {
        continue;
      }
      if (start_after && !(*start_after < *key)) {
        continue;
      }
      entries.emplace_back(std::move(*key), encoder.decode<T>(raw_value));
    }
    return entries;
  }

  std::vector<entry_t> entries(const kv_store& store) const {
    return range(store, std::nullopt, std::nullopt);
  }

 private:
  conduit::schema::bytes_t make_key(const Key& key) const {
    auto builder = conduit::schema::key::builder{.data = prefix_};
    detail::write_map_key(builder, key);
    return builder.data;
  }

  conduit::schema::bytes_t prefix_;
};

}  // namespace conduit::storage
