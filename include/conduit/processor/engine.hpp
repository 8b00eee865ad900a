#pragma once

#include <conduit/host/contract.hpp>
#include <conduit/host/response.hpp>
#include <conduit/schema/execution_result.hpp>
#include <conduit/schema/message_batch.hpp>
#include <conduit/schema/primitives.hpp>
#include <conduit/schema/processor_config.hpp>
#include <conduit/schema/processor_msg.hpp>
#include <conduit/storage/storage.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace conduit::processor {

/// Per-domain execution engine.
///
/// Batches wait in two FIFO lanes (high drains before medium) and only move
/// when someone ticks. A tick looks at the head batch of the busiest lane and
/// either finalizes it (expired), leaves it alone (cooldown or pending
/// confirmation) or starts one sub-call for it. Atomic batches run as a self
/// call so one failing function reverts all of them; non-atomic batches run
/// one function per tick and keep their position across retries. Every
/// sub-call is correlated through a reply id.
///
/// Queries (SCALE encoded answers):
///   /config, /owner, /is_queue_empty
///   /queue                 queue_request_t
///   /retry                 execution_id_t
///   /pending_callback      execution_id_t
///   /pending_confirmation  execution_id_t
class engine final : public conduit::host::contract {
 public:
  conduit::host::response instantiate(
      conduit::storage::kv_store& store,
      const conduit::host::env& environment,
      const conduit::host::message_info& info,
      const conduit::schema::bytes_view_t& msg) override;

  conduit::host::response execute(
      conduit::storage::kv_store& store,
      const conduit::host::env& environment,
      const conduit::host::message_info& info,
      const conduit::schema::bytes_view_t& msg) override;

  conduit::host::response reply(conduit::storage::kv_store& store,
                                const conduit::host::env& environment,
                                const conduit::host::reply& outcome) override;

  conduit::schema::query_result_t query(
      const conduit::storage::kv_store& store,
      const conduit::host::env& environment,
      std::string_view path,
      const conduit::schema::bytes_view_t& data) const override;

 private:
  struct batch_location final {
    conduit::schema::priority_t priority{conduit::schema::priority_t::medium};
    std::size_t position{};
    conduit::schema::message_batch_t batch;
  };

  conduit::host::response update_config(
      conduit::storage::kv_store& store,
      const conduit::host::message_info& info,
      const conduit::schema::update_config_t& msg);

  conduit::host::response authorization_module_action(
      conduit::storage::kv_store& store,
      const conduit::host::env& environment,
      const conduit::schema::authorization_module_msg_t& msg);

  conduit::host::response evict(conduit::storage::kv_store& store,
                                const conduit::host::env& environment,
                                const conduit::schema::evict_msgs_t& msg);

  conduit::host::response tick(conduit::storage::kv_store& store,
                               const conduit::host::env& environment);

  conduit::host::response function_confirmation(
      conduit::storage::kv_store& store,
      const conduit::host::env& environment,
      const conduit::host::message_info& info,
      const conduit::schema::function_confirmation_t& msg);

  conduit::host::response execute_atomic(
      const conduit::host::env& environment,
      const conduit::host::message_info& info,
      const conduit::schema::execute_atomic_t& msg) const;

  conduit::host::response retry_callback(
      conduit::storage::kv_store& store,
      const conduit::host::env& environment,
      const conduit::schema::retry_callback_t& msg);

  conduit::host::response retry_proxy_creation(
      conduit::storage::kv_store& store,
      const conduit::host::env& environment);

  conduit::host::response polytone_callback(
      conduit::storage::kv_store& store,
      const conduit::host::env& environment,
      const conduit::host::message_info& info,
      const conduit::schema::polytone_callback_message_t& msg);

  conduit::host::response hyperlane_callback(
      conduit::storage::kv_store& store,
      const conduit::host::env& environment,
      const conduit::host::message_info& info,
      const conduit::schema::hyperlane_handle_t& msg);

  /// Function `index` of `batch` finished; move on or complete the batch.
  void advance(conduit::storage::kv_store& store,
               const conduit::host::env& environment,
               const batch_location& location,
               std::size_t index,
               conduit::host::response& result);

  /// Function `index` (0 for atomic batches) failed; schedule a retry or
  /// give up on the batch.
  void handle_failure(conduit::storage::kv_store& store,
                      const conduit::host::env& environment,
                      const batch_location& location,
                      std::size_t index,
                      const std::string& error,
                      conduit::host::response& result);

  /// Dequeue the batch, drop its bookkeeping and report `outcome`.
  void finalize(conduit::storage::kv_store& store,
                const conduit::host::env& environment,
                const batch_location& location,
                const conduit::schema::execution_result_t& outcome,
                conduit::host::response& result);

  /// Finalize every queued batch past its expiration time, whatever its
  /// position or retry state. Returns how many were finalized.
  std::size_t expire_batches(conduit::storage::kv_store& store,
                             const conduit::host::env& environment,
                             conduit::host::response& result);

  conduit::schema::cosmos_msg_t make_callback(
      conduit::storage::kv_store& store,
      const conduit::host::env& environment,
      conduit::schema::execution_id_t execution_id,
      const conduit::schema::execution_result_t& outcome) const;

  std::optional<batch_location> find_batch(
      const conduit::storage::kv_store& store,
      conduit::schema::execution_id_t execution_id) const;

  bool is_authorization_module(
      const conduit::schema::processor_config_t& config,
      const conduit::schema::address_t& sender) const;

  uint64_t next_reply_id(conduit::storage::kv_store& store) const;
};

}  // namespace conduit::processor
