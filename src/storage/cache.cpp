#include <conduit/storage/cache.hpp>

#include <algorithm>
#include <iterator>

namespace conduit::storage {

namespace {

bool has_prefix(const conduit::schema::bytes_t& key,
                const conduit::schema::bytes_view_t& prefix) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key));
}

}  // namespace

cache_store::cache_store(kv_store& parent) : parent_{parent} {}

std::optional<conduit::schema::bytes_t> cache_store::get(
    const conduit::schema::bytes_view_t& key) const {
  auto it = writes_.find(conduit::schema::make_bytes(key));
  if (it != std::end(writes_)) {
    return it->second;
  }
  return parent_.get(key);
}

void cache_store::put(const conduit::schema::bytes_view_t& key,
                      const conduit::schema::bytes_view_t& value) {
  writes_[conduit::schema::make_bytes(key)] = conduit::schema::make_bytes(value);
}

void cache_store::remove(const conduit::schema::bytes_view_t& key) {
  writes_[conduit::schema::make_bytes(key)] = std::nullopt;
}

std::vector<key_value_entry_t> cache_store::list_by_prefix(
    const conduit::schema::bytes_view_t& prefix) const {
  auto base = parent_.list_by_prefix(prefix);

  // Merge the parent's sorted listing with the sorted overlay.
  auto merged = std::vector<key_value_entry_t>{};
  merged.reserve(base.size());
  auto overlay = writes_.lower_bound(conduit::schema::make_bytes(prefix));
  auto overlay_end = std::end(writes_);
  auto emit_overlay = [&merged](const auto& entry) {
    if (entry.second) {
      merged.emplace_back(entry.first, *entry.second);
    }
  };

  auto parent_it = std::begin(base);
  while (parent_it != std::end(base)) {
    if (overlay != overlay_end && has_prefix(overlay->first, prefix) &&
        overlay->first <= parent_it->first) {
      if (overlay->first == parent_it->first) {
        ++parent_it;
      }
      emit_overlay(*overlay);
      ++overlay;
      continue;
    }
    merged.push_back(std::move(*parent_it));
    ++parent_it;
  }
  for (; overlay != overlay_end && has_prefix(overlay->first, prefix);
       ++overlay) {
    emit_overlay(*overlay);
  }
  return merged;
}

void cache_store::commit() {
  if (writes_.empty()) {
    return;
  }
  auto operations = std::vector<write_operation>{};
  operations.reserve(writes_.size());
  for (auto& [key, value] : writes_) {
    operations.push_back(write_operation{.key = key, .value = value});
  }
  parent_.apply(operations);
  writes_.clear();
}

void cache_store::discard() {
  writes_.clear();
}

prefixed_store::prefixed_store(kv_store& inner, conduit::schema::bytes_t prefix)
    : inner_{inner}, prefix_{std::move(prefix)} {}

conduit::schema::bytes_t prefixed_store::make_key(
    const conduit::schema::bytes_view_t& key) const {
  auto full = prefix_;
  full.insert(std::end(full), std::begin(key), std::end(key));
  return full;
}

std::optional<conduit::schema::bytes_t> prefixed_store::get(
    const conduit::schema::bytes_view_t& key) const {
  return inner_.get(make_key(key));
}

void prefixed_store::put(const conduit::schema::bytes_view_t& key,
                         const conduit::schema::bytes_view_t& value) {
  inner_.put(make_key(key), value);
}

void prefixed_store::remove(const conduit::schema::bytes_view_t& key) {
  inner_.remove(make_key(key));
}

std::vector<key_value_entry_t> prefixed_store::list_by_prefix(
    const conduit::schema::bytes_view_t& prefix) const {
  auto entries = inner_.list_by_prefix(make_key(prefix));
  for (auto& entry : entries) {
    entry.first.erase(std::begin(entry.first),
                      std::next(std::begin(entry.first),
                                static_cast<std::ptrdiff_t>(prefix_.size())));
  }
  return entries;
}

}  // namespace conduit::storage
