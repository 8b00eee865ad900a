#include <conduit/storage/cache.hpp>
#include <conduit/storage/deque.hpp>
#include <conduit/storage/item.hpp>
#include <conduit/storage/map.hpp>
#include <conduit/storage/rocksdb/storage.hpp>
#include <conduit/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

using namespace conduit::testing;

namespace {

conduit::schema::bytes_t bytes(const std::string& value) {
  return conduit::schema::make_bytes(value);
}

class storage_fixture final {
 public:
  explicit storage_fixture(const std::string_view prefix)
      : db_path_{make_db_path(prefix)},
        storage_{conduit::storage::make_storage<
            conduit::storage::rocksdb_storage_tag>(db_path_)} {}

  storage_fixture(const storage_fixture&) = delete;
  storage_fixture& operator=(const storage_fixture&) = delete;
  storage_fixture(storage_fixture&&) = delete;
  storage_fixture& operator=(storage_fixture&&) = delete;

  ~storage_fixture() { remove_path(db_path_); }

  conduit::storage::rocksdb_storage_t& storage() { return storage_; }
  const std::string& db_path() const { return db_path_; }

 private:
  std::string db_path_;
  conduit::storage::rocksdb_storage_t storage_;
};

}  // namespace

TEST(storage, rocksdb_get_put_remove) {
  auto fixture = storage_fixture{"conduit_storage_basic"};
  auto& store = fixture.storage();

  EXPECT_FALSE(store.get(bytes("alpha")).has_value());
  store.put(bytes("alpha"), bytes("one"));
  auto value = store.get(bytes("alpha"));
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, bytes("one"));

  store.remove(bytes("alpha"));
  EXPECT_FALSE(store.get(bytes("alpha")).has_value());
}

TEST(storage, rocksdb_lists_prefix_in_key_order) {
  auto fixture = storage_fixture{"conduit_storage_prefix"};
  auto& store = fixture.storage();
  store.put(bytes("p|b"), bytes("2"));
  store.put(bytes("p|a"), bytes("1"));
  store.put(bytes("q|a"), bytes("x"));

  auto entries = store.list_by_prefix(bytes("p|"));
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].first, bytes("p|a"));
  EXPECT_EQ(entries[1].first, bytes("p|b"));
}

TEST(storage, rocksdb_applies_write_batches) {
  auto fixture = storage_fixture{"conduit_storage_batch"};
  auto& store = fixture.storage();
  store.put(bytes("gone"), bytes("soon"));

  store.apply({conduit::storage::write_operation{.key = bytes("kept"),
                                                 .value = bytes("yes")},
               conduit::storage::write_operation{.key = bytes("gone")}});

  EXPECT_EQ(store.get(bytes("kept")), bytes("yes"));
  EXPECT_FALSE(store.get(bytes("gone")).has_value());
}

TEST(storage, values_survive_reopening) {
  auto path = make_db_path("conduit_storage_reopen");
  {
    auto store = conduit::storage::make_storage<
        conduit::storage::rocksdb_storage_tag>(path);
    store.put(bytes("durable"), bytes("value"));
  }
  {
    auto store = conduit::storage::make_storage<
        conduit::storage::rocksdb_storage_tag>(path);
    EXPECT_EQ(store.get(bytes("durable")), bytes("value"));
  }
  remove_path(path);
}

TEST(storage, cache_commits_buffered_writes) {
  auto fixture = storage_fixture{"conduit_storage_cache_commit"};
  auto& store = fixture.storage();
  store.put(bytes("removed"), bytes("old"));

  auto cache = conduit::storage::cache_store{store};
  cache.put(bytes("added"), bytes("new"));
  cache.remove(bytes("removed"));

  EXPECT_EQ(cache.get(bytes("added")), bytes("new"));
  EXPECT_FALSE(cache.get(bytes("removed")).has_value());
  EXPECT_FALSE(store.get(bytes("added")).has_value());
  EXPECT_EQ(cache.pending_writes(), 2u);

  cache.commit();
  EXPECT_EQ(cache.pending_writes(), 0u);
  EXPECT_EQ(store.get(bytes("added")), bytes("new"));
  EXPECT_FALSE(store.get(bytes("removed")).has_value());
}

TEST(storage, cache_discard_leaves_parent_untouched) {
  auto fixture = storage_fixture{"conduit_storage_cache_discard"};
  auto& store = fixture.storage();
  store.put(bytes("key"), bytes("before"));
  {
    auto cache = conduit::storage::cache_store{store};
    cache.put(bytes("key"), bytes("after"));
    cache.discard();
    EXPECT_EQ(cache.get(bytes("key")), bytes("before"));
  }
  {
    auto cache = conduit::storage::cache_store{store};
    cache.put(bytes("key"), bytes("dropped"));
  }
  EXPECT_EQ(store.get(bytes("key")), bytes("before"));
}

TEST(storage, nested_caches_merge_prefix_listings) {
  auto fixture = storage_fixture{"conduit_storage_cache_nested"};
  auto& store = fixture.storage();
  store.put(bytes("n|a"), bytes("1"));
  store.put(bytes("n|c"), bytes("3"));

  auto outer = conduit::storage::cache_store{store};
  outer.put(bytes("n|b"), bytes("2"));
  auto inner = conduit::storage::cache_store{outer};
  inner.remove(bytes("n|c"));
  inner.put(bytes("n|d"), bytes("4"));

  auto entries = inner.list_by_prefix(bytes("n|"));
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].first, bytes("n|a"));
  EXPECT_EQ(entries[1].first, bytes("n|b"));
  EXPECT_EQ(entries[2].first, bytes("n|d"));

  inner.commit();
  EXPECT_TRUE(store.get(bytes("n|c")).has_value());
  outer.commit();
  EXPECT_FALSE(store.get(bytes("n|c")).has_value());
  EXPECT_EQ(store.get(bytes("n|d")), bytes("4"));
}

TEST(storage, prefixed_store_isolates_namespaces) {
  auto fixture = storage_fixture{"conduit_storage_prefixed"};
  auto& store = fixture.storage();
  auto left = conduit::storage::prefixed_store{store, bytes("left|")};
  auto right = conduit::storage::prefixed_store{store, bytes("right|")};

  left.put(bytes("key"), bytes("l"));
  right.put(bytes("key"), bytes("r"));

  EXPECT_EQ(left.get(bytes("key")), bytes("l"));
  EXPECT_EQ(right.get(bytes("key")), bytes("r"));
  EXPECT_EQ(store.get(bytes("left|key")), bytes("l"));

  auto entries = left.list_by_prefix(bytes(""));
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].first, bytes("key"));
}

TEST(storage, item_round_trips_values) {
  auto fixture = storage_fixture{"conduit_storage_item"};
  auto& store = fixture.storage();
  const auto counter = conduit::storage::item<uint64_t>{"counter"};

  EXPECT_FALSE(counter.exists(store));
  EXPECT_FALSE(counter.may_load(store).has_value());
  counter.save(store, 41);
  EXPECT_EQ(counter.load(store), 41u);
  counter.remove(store);
  EXPECT_FALSE(counter.exists(store));
}

TEST(storage, map_orders_integer_keys_numerically) {
  auto fixture = storage_fixture{"conduit_storage_map_int"};
  auto& store = fixture.storage();
  const auto values = conduit::storage::map<uint64_t, std::string>{"values"};

  values.save(store, 256, "big");
  values.save(store, 2, "two");
  values.save(store, 10, "ten");

  auto all = values.entries(store);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].first, 2u);
  EXPECT_EQ(all[1].first, 10u);
  EXPECT_EQ(all[2].first, 256u);

  auto page = values.range(store, uint64_t{2}, std::size_t{1});
  ASSERT_EQ(page.size(), 1u);
  EXPECT_EQ(page[0].second, "ten");
}

TEST(storage, map_pages_string_keys) {
  auto fixture = storage_fixture{"conduit_storage_map_string"};
  auto& store = fixture.storage();
  const auto labels = conduit::storage::map<std::string, uint64_t>{"labels"};
  const auto other = conduit::storage::map<std::string, uint64_t>{"labels_x"};

  labels.save(store, "b", 2);
  labels.save(store, "a", 1);
  labels.save(store, "c", 3);
  other.save(store, "a", 99);

  EXPECT_TRUE(labels.has(store, "a"));
  EXPECT_EQ(labels.entries(store).size(), 3u);

  auto page = labels.range(store, std::string{"a"}, std::size_t{5});
  ASSERT_EQ(page.size(), 2u);
  EXPECT_EQ(page[0].first, "b");
  EXPECT_EQ(page[1].first, "c");

  labels.remove(store, "b");
  EXPECT_FALSE(labels.may_load(store, "b").has_value());
}

TEST(storage, deque_supports_fifo_and_positional_access) {
  auto fixture = storage_fixture{"conduit_storage_deque"};
  auto& store = fixture.storage();
  const auto queue = conduit::storage::deque<uint64_t>{"queue"};

  EXPECT_TRUE(queue.empty(store));
  queue.push_back(store, 1);
  queue.push_back(store, 3);
  EXPECT_TRUE(queue.insert_at(store, 1, 2));
  EXPECT_FALSE(queue.insert_at(store, 10, 4));
  EXPECT_EQ(queue.load(store), (std::vector<uint64_t>{1, 2, 3}));

  EXPECT_EQ(queue.at(store, 2), std::optional<uint64_t>{3});
  EXPECT_FALSE(queue.at(store, 3).has_value());
  EXPECT_EQ(queue.range(store, 1, 10), (std::vector<uint64_t>{2, 3}));
  EXPECT_TRUE(queue.range(store, 3, 5).empty());

  EXPECT_EQ(queue.remove_at(store, 1), std::optional<uint64_t>{2});
  EXPECT_EQ(queue.pop_front(store), std::optional<uint64_t>{1});
  EXPECT_EQ(queue.front(store), std::optional<uint64_t>{3});
  EXPECT_EQ(queue.size(store), 1u);
}
