#pragma once

#include <conduit/host/contract.hpp>
#include <conduit/host/response.hpp>
#include <conduit/schema/authorization.hpp>
#include <conduit/schema/authorization_msg.hpp>
#include <conduit/schema/callback_info.hpp>
#include <conduit/schema/domain.hpp>
#include <conduit/schema/primitives.hpp>
#include <conduit/storage/storage.hpp>
#include <optional>
#include <string_view>

namespace conduit::authorization {

/// Authorization registry contract.
///
/// Owns authorization definitions, the external domain registry, the mint
/// ledger, per-label concurrency counters and the bookkeeping of every
/// execution id it handed out. Batches leave through the router towards the
/// processor of the authorization's domain; results come back through
/// processor callbacks, Polytone note callbacks or Hyperlane mailbox
/// deliveries.
///
/// Queries (SCALE encoded answers):
///   /owner, /sub_owners, /processor
///   /external_domains     page_request_t
///   /external_domain      raw domain name
///   /authorizations       page_request_t
///   /processor_callbacks  id_page_request_t
///   /processor_callback   execution_id_t
///   /mint_balance         mint_balance_request_t
///   /current_executions   raw label
class registry final : public conduit::host::contract {
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

  conduit::schema::query_result_t query(
      const conduit::storage::kv_store& store,
      const conduit::host::env& environment,
      std::string_view path,
      const conduit::schema::bytes_view_t& data) const override;

 private:
  conduit::host::response execute_owner(
      conduit::storage::kv_store& store,
      const conduit::host::message_info& info,
      const conduit::schema::owner_msg_t& msg);

  conduit::host::response execute_permissioned(
      conduit::storage::kv_store& store,
      const conduit::host::env& environment,
      const conduit::host::message_info& info,
      const conduit::schema::permissioned_msg_t& msg);

  conduit::host::response execute_permissionless(
      conduit::storage::kv_store& store,
      const conduit::host::env& environment,
      const conduit::host::message_info& info,
      const conduit::schema::permissionless_msg_t& msg);

  conduit::host::response add_external_domains(
      conduit::storage::kv_store& store,
      const conduit::host::env& environment,
      const conduit::schema::add_external_domains_t& msg);

  conduit::host::response create_authorizations(
      conduit::storage::kv_store& store,
      const conduit::host::env& environment,
      const conduit::schema::create_authorizations_t& msg);

  conduit::host::response modify_authorization(
      conduit::storage::kv_store& store,
      const conduit::schema::modify_authorization_t& msg);

  conduit::host::response set_authorization_state(
      conduit::storage::kv_store& store,
      const std::string& label,
      conduit::schema::authorization_state_t state);

  conduit::host::response mint_authorizations(
      conduit::storage::kv_store& store,
      const conduit::schema::mint_authorizations_t& msg);

  conduit::host::response add_msgs(conduit::storage::kv_store& store,
                                   const conduit::host::env& environment,
                                   const conduit::host::message_info& info,
                                   const conduit::schema::add_msgs_t& msg);

  /// Route an administrative processor message without callback tracking.
  conduit::host::response forward_to_processor(
      const conduit::storage::kv_store& store,
      const conduit::host::env& environment,
      const conduit::schema::domain_t& domain,
      const conduit::schema::bytes_t& payload,
      std::string_view action);

  conduit::host::response send_msgs(conduit::storage::kv_store& store,
                                    const conduit::host::env& environment,
                                    const conduit::host::message_info& info,
                                    const conduit::schema::send_msgs_t& msg);

  conduit::host::response processor_callback(
      conduit::storage::kv_store& store,
      const conduit::schema::address_t& sender,
      const conduit::schema::processor_callback_t& msg);

  conduit::host::response retry_msgs(conduit::storage::kv_store& store,
                                     const conduit::host::env& environment,
                                     const conduit::schema::retry_msgs_t& msg);

  conduit::host::response retry_bridge_creation(
      conduit::storage::kv_store& store,
      const conduit::host::env& environment,
      const conduit::schema::retry_bridge_creation_t& msg);

  conduit::host::response polytone_callback(
      conduit::storage::kv_store& store,
      const conduit::host::env& environment,
      const conduit::host::message_info& info,
      const conduit::schema::polytone_callback_message_t& msg);

  conduit::host::response hyperlane_callback(
      conduit::storage::kv_store& store,
      const conduit::host::message_info& info,
      const conduit::schema::hyperlane_handle_t& msg);

  /// Add the message carrying `payload` to the processor of `domain` to
  /// `result`. Returns an error response when the domain is unreachable.
  std::optional<conduit::host::response> route(
      const conduit::storage::kv_store& store,
      const conduit::host::env& environment,
      const conduit::schema::domain_t& domain,
      conduit::schema::bytes_t payload,
      const std::optional<conduit::schema::execution_id_t>& execution_id,
      conduit::host::response& result) const;

  /// Release what a finished execution held: its concurrency slot and, when
  /// nothing ran, the escrowed mint.
  void settle(conduit::storage::kv_store& store,
              conduit::schema::processor_callback_info_t& callback) const;

  conduit::schema::execution_id_t next_execution_id(
      conduit::storage::kv_store& store) const;

  bool is_owner(const conduit::storage::kv_store& store,
                const conduit::schema::address_t& address) const;
  bool is_permissioned(const conduit::storage::kv_store& store,
                       const conduit::schema::address_t& address) const;
};

}  // namespace conduit::authorization
