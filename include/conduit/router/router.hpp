#pragma once

#include <conduit/schema/cosmos_msg.hpp>
#include <conduit/schema/domain.hpp>
#include <conduit/schema/hyperlane.hpp>
#include <conduit/schema/message_details.hpp>
#include <conduit/schema/polytone.hpp>
#include <conduit/schema/primitives.hpp>
#include <conduit/schema/processor_config.hpp>
#include <conduit/schema/processor_state.hpp>
#include <optional>
#include <string_view>

// Domain routing and bridge adaptation.
// Pure functions: every call builds the host message that carries an opaque
// payload to its destination, or interprets what a bridge reported back.
namespace conduit::router {

inline constexpr auto kProxyAddressPrefix = std::string_view{"proxy1"};

/// Direct execute on a processor living on the same chain.
conduit::schema::cosmos_msg_t route_to_main(
    const conduit::schema::address_t& processor,
    conduit::schema::bytes_t payload);

/// Note execute that makes the initiator's proxy on the remote chain call
/// `processor`. With a tag set, the note reports the outcome to
/// `callback_receiver`.
conduit::schema::cosmos_msg_t route_through_polytone(
    const conduit::schema::address_t& note,
    uint64_t timeout_seconds,
    const conduit::schema::address_t& processor,
    conduit::schema::bytes_t payload,
    const conduit::schema::address_t& callback_receiver,
    const std::optional<conduit::schema::polytone_callback_tag_t>& tag);

/// Zero message note execute; only materializes the initiator's proxy.
conduit::schema::cosmos_msg_t create_proxy_message(
    const conduit::schema::address_t& note,
    uint64_t timeout_seconds,
    const conduit::schema::address_t& callback_receiver,
    const conduit::schema::polytone_callback_tag_t& tag);

/// Mailbox dispatch of `payload` to `recipient` on `destination_domain`.
conduit::schema::cosmos_msg_t route_through_hyperlane(
    const conduit::schema::address_t& mailbox,
    uint32_t destination_domain,
    const conduit::schema::address_t& recipient,
    conduit::schema::bytes_t payload);

/// Message delivering an encoded processor message to the processor of an
/// external domain. Polytone deliveries are tagged with `execution_id` when
/// one is given.
conduit::schema::cosmos_msg_t route_to_external(
    const conduit::schema::external_domain_t& domain,
    conduit::schema::bytes_t payload,
    const conduit::schema::address_t& callback_receiver,
    const std::optional<conduit::schema::execution_id_t>& execution_id);

/// Message delivering an encoded registry message from a processor back to
/// the authorization contract on the main domain.
conduit::schema::cosmos_msg_t route_callback(
    const conduit::schema::processor_config_t& config,
    const conduit::schema::address_t& processor,
    conduit::schema::bytes_t payload,
    conduit::schema::execution_id_t execution_id);

/// Remote proxy address owned by `initiator` behind `note`. Both sides of a
/// bridge derive the same address.
conduit::schema::address_t derive_proxy_address(
    const conduit::schema::address_t& note,
    const conduit::schema::address_t& initiator);

/// Proxy lifecycle step reported by a create-proxy callback.
conduit::schema::polytone_proxy_state_t next_proxy_state(
    const conduit::schema::polytone_execute_result_t& result);

/// Bridge leg state reported by a delivery callback.
conduit::schema::bridge_state_t bridge_state_of(
    const conduit::schema::polytone_execute_result_t& result);

/// Whether the environment can run a message of the given type.
bool supports_message_type(
    const conduit::schema::execution_environment_t& environment,
    conduit::schema::message_type_t message_type);

std::optional<conduit::schema::polytone_callback_tag_t> decode_tag(
    const conduit::schema::bytes_view_t& bytes);

}  // namespace conduit::router
