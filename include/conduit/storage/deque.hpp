#pragma once
#include <conduit/storage/item.hpp>
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <vector>

namespace conduit::storage {

/// Ordered collection supporting FIFO access and positional insert/removal.
/// The whole sequence lives under one key.
template <typename T>
class deque final {
 public:
  explicit deque(const std::string_view key) : items_{key} {}

  std::size_t size(const kv_store& store) const { return load(store).size(); }

  bool empty(const kv_store& store) const { return size(store) == 0; }

  std::optional<T> front(const kv_store& store) const {
    return at(store, 0);
  }

  std::optional<T> at(const kv_store& store, const std::size_t position) const {
    auto values = load(store);
    if (position >= values.size()) {
      return std::nullopt;
    }
    return values[position];
  }

  void push_back(kv_store& store, const T& value) const {
    auto values = load(store);
    values.push_back(value);
    items_.save(store, values);
  }

  /// False when position is beyond the end of the sequence.
  bool insert_at(kv_store& store, const std::size_t position,
                 const T& value) const {
    auto values = load(store);
    if (position > values.size()) {
      return false;
    }
    values.insert(std::next(std::begin(values),
                            static_cast<std::ptrdiff_t>(position)),
                  value);
    items_.save(store, values);
    return true;
  }

  std::optional<T> remove_at(kv_store& store, const std::size_t position) const {
    auto values = load(store);
    if (position >= values.size()) {
      return std::nullopt;
    }
    auto it = std::next(std::begin(values), static_cast<std::ptrdiff_t>(position));
    auto removed = std::move(*it);
    values.erase(it);
    items_.save(store, values);
    return removed;
  }

  std::optional<T> pop_front(kv_store& store) const {
    return remove_at(store, 0);
  }

  /// Elements in [from, to), clamped to the sequence bounds.
  std::vector<T> range(const kv_store& store, const std::size_t from,
                       const std::size_t to) const {
    auto values = load(store);
    auto end = std::min(to, values.size());
    if (from >= end) {
      return {};
    }
    return std::vector<T>(
        std::next(std::begin(values), static_cast<std::ptrdiff_t>(from)),
        std::next(std::begin(values), static_cast<std::ptrdiff_t>(end)));
  }

  std::vector<T> load(const kv_store& store) const {
    return items_.may_load(store).value_or(std::vector<T>{});
  }

 private:
  item<std::vector<T>> items_;
};

}  // namespace conduit::storage
