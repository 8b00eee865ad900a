#pragma once

#include <conduit/host/contract.hpp>
#include <conduit/host/response.hpp>
#include <conduit/schema/cosmos_msg.hpp>
#include <conduit/schema/primitives.hpp>
#include <conduit/schema/query_result.hpp>
#include <conduit/schema/transaction_result.hpp>
#include <conduit/storage/cache.hpp>
#include <conduit/storage/storage.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit::host {

inline constexpr std::size_t kMaxDispatchDepth = 16;
inline constexpr uint64_t kDefaultBlockSeconds = 5;

/// Deterministic single chain contract host.
///
/// Every transaction runs in a cache branch over the backing store and is
/// committed only when the whole call tree succeeds. Each dispatched
/// sub-message gets a nested branch, so a failing sub-message is rolled back
/// on its own and, when the caller asked for it, reported through reply().
/// Public entry points are serialized by an internal mutex.
class chain final {
 public:
  chain(std::string chain_id,
        conduit::storage::kv_store& backend,
        conduit::schema::timestamp_seconds_t genesis_time);

  chain(const chain&) = delete;
  chain& operator=(const chain&) = delete;
  chain(chain&&) = delete;
  chain& operator=(chain&&) = delete;
  ~chain() = default;

  /// Make code callable at address. Instantiation is a separate transaction.
  void register_contract(const conduit::schema::address_t& address,
                         std::shared_ptr<contract> code,
                         std::optional<conduit::schema::address_t> admin =
                             std::nullopt);
  bool has_contract(const conduit::schema::address_t& address) const;
  bool is_instantiated(const conduit::schema::address_t& address) const;

  conduit::schema::transaction_result_t instantiate(
      const conduit::schema::address_t& sender,
      const conduit::schema::address_t& address,
      const conduit::schema::bytes_view_t& msg);

  conduit::schema::transaction_result_t execute(
      const conduit::schema::address_t& sender,
      const conduit::schema::address_t& contract_address,
      const conduit::schema::bytes_view_t& msg);

  conduit::schema::transaction_result_t migrate(
      const conduit::schema::address_t& sender,
      const conduit::schema::address_t& contract_address,
      uint64_t code_id,
      const conduit::schema::bytes_view_t& msg);

  /// Decode a SCALE transaction envelope and execute it.
  conduit::schema::transaction_result_t submit(
      const conduit::schema::bytes_view_t& encoded_transaction);

  conduit::schema::query_result_t query(
      const conduit::schema::address_t& contract_address,
      std::string_view path,
      const conduit::schema::bytes_view_t& data) const;

  /// Finalize the open block (persisting height, time and app hash) and open
  /// the next one `blocks` heights and `seconds` later.
  conduit::storage::committed_state advance_block(
      uint64_t blocks = 1,
      uint64_t seconds = kDefaultBlockSeconds);

  /// Last finalized block, if any was ever finalized on this store.
  std::optional<conduit::storage::committed_state> load_committed_state() const;

  conduit::schema::block_info_t block() const;
  const std::string& chain_id() const { return chain_id_; }
  conduit::schema::hash32_t app_hash() const;

 private:
  struct registration final {
    std::shared_ptr<contract> code;
    std::optional<conduit::schema::address_t> admin;
  };

  using events_t = std::vector<conduit::schema::contract_event_t>;
  using body_t =
      std::function<response(conduit::storage::kv_store&, events_t&)>;

  conduit::schema::transaction_result_t run_transaction(
      const conduit::schema::address_t& sender,
      const conduit::schema::address_t& contract_address,
      const conduit::schema::bytes_view_t& msg,
      const body_t& body);

  response dispatch(conduit::storage::kv_store& parent,
                    const conduit::schema::address_t& sender,
                    const conduit::schema::cosmos_msg_t& msg,
                    std::size_t depth,
                    events_t& events);

  response run_reply(conduit::storage::kv_store& parent,
                     const conduit::schema::address_t& address,
                     const reply& outcome,
                     std::size_t depth,
                     events_t& events);

  response settle(conduit::storage::kv_store& branch,
                  const conduit::schema::address_t& address,
                  response result,
                  std::size_t depth,
                  events_t& events);

  const registration* find(const conduit::schema::address_t& address) const;
  bool instantiated_in(const conduit::storage::kv_store& store,
                       const conduit::schema::address_t& address) const;
  env make_env(const conduit::schema::address_t& address) const;

  std::string chain_id_;
  conduit::storage::kv_store& backend_;
  conduit::schema::block_info_t block_;
  conduit::schema::hash32_t app_hash_{};
  std::map<conduit::schema::address_t, registration> contracts_;
  mutable std::mutex mutex_;
};

/// Contract local view of a chain level store.
conduit::storage::prefixed_store contract_store(
    conduit::storage::kv_store& store,
    const conduit::schema::address_t& address);

}  // namespace conduit::host
