#include <conduit/blake3/hash.hpp>
#include <conduit/router/router.hpp>
#include <conduit/schema/encoding/scale/encoder.hpp>
#include <conduit/schema/key/builder.hpp>
#include <spdlog/spdlog.h>

namespace conduit::router {

namespace {

using encoder_t = conduit::schema::encoding::scale_encoder_t;

conduit::schema::cosmos_msg_t note_execute(
    const conduit::schema::address_t& note,
    conduit::schema::polytone_execute_t execute) {
  auto encoder = encoder_t{};
  return conduit::schema::wasm_execute_t{.contract_address = note,
                                         .msg = encoder.encode(execute)};
}

conduit::schema::polytone_callback_request_t make_callback_request(
    const conduit::schema::address_t& receiver,
    const conduit::schema::polytone_callback_tag_t& tag) {
  auto encoder = encoder_t{};
  return conduit::schema::polytone_callback_request_t{
      .receiver = receiver, .msg = encoder.encode(tag)};
}

}  // namespace

conduit::schema::cosmos_msg_t route_to_main(
    const conduit::schema::address_t& processor,
    conduit::schema::bytes_t payload) {
  return conduit::schema::wasm_execute_t{.contract_address = processor,
                                         .msg = std::move(payload)};
}

conduit::schema::cosmos_msg_t route_through_polytone(
    const conduit::schema::address_t& note,
    const uint64_t timeout_seconds,
    const conduit::schema::address_t& processor,
    conduit::schema::bytes_t payload,
    const conduit::schema::address_t& callback_receiver,
    const std::optional<conduit::schema::polytone_callback_tag_t>& tag) {
  auto execute = conduit::schema::polytone_execute_t{
      .timeout_seconds = timeout_seconds};
  execute.msgs.push_back(route_to_main(processor, std::move(payload)));
  if (tag) {
    execute.callback = make_callback_request(callback_receiver, *tag);
  }
  return note_execute(note, std::move(execute));
}

conduit::schema::cosmos_msg_t create_proxy_message(
    const conduit::schema::address_t& note,
    const uint64_t timeout_seconds,
    const conduit::schema::address_t& callback_receiver,
    const conduit::schema::polytone_callback_tag_t& tag) {
  return note_execute(
      note, conduit::schema::polytone_execute_t{
                .callback = make_callback_request(callback_receiver, tag),
                .timeout_seconds = timeout_seconds});
}

conduit::schema::cosmos_msg_t route_through_hyperlane(
    const conduit::schema::address_t& mailbox,
    const uint32_t destination_domain,
    const conduit::schema::address_t& recipient,
    conduit::schema::bytes_t payload) {
  auto encoder = encoder_t{};
  auto dispatch =
      conduit::schema::hyperlane_dispatch_t{.destination_domain =
                                                destination_domain,
                                            .recipient = recipient,
                                            .body = std::move(payload)};
  return conduit::schema::wasm_execute_t{.contract_address = mailbox,
                                         .msg = encoder.encode(dispatch)};
}

conduit::schema::cosmos_msg_t route_to_external(
    const conduit::schema::external_domain_t& domain,
    conduit::schema::bytes_t payload,
    const conduit::schema::address_t& callback_receiver,
    const std::optional<conduit::schema::execution_id_t>& execution_id) {
  return std::visit(
      overloaded{
          [&](const conduit::schema::cosmwasm_environment_t& environment) {
            auto tag =
                std::optional<conduit::schema::polytone_callback_tag_t>{};
            if (execution_id) {
              tag = conduit::schema::polytone_tag_execution_id_t{
                  .execution_id = *execution_id};
            }
            return route_through_polytone(
                environment.polytone.note.address,
                environment.polytone.note.timeout_seconds, domain.processor,
                std::move(payload), callback_receiver, tag);
          },
          [&](const conduit::schema::evm_environment_t& environment) {
            return route_through_hyperlane(environment.hyperlane.mailbox,
                                           environment.hyperlane.domain_id,
                                           domain.processor,
                                           std::move(payload));
          }},
      domain.execution_environment);
}

conduit::schema::cosmos_msg_t route_callback(
    const conduit::schema::processor_config_t& config,
    const conduit::schema::address_t& processor,
    conduit::schema::bytes_t payload,
    const conduit::schema::execution_id_t execution_id) {
  return std::visit(
      overloaded{
          [&](const conduit::schema::processor_domain_main_t&) {
            return route_to_main(config.authorization_contract,
                                 std::move(payload));
          },
          [&](const conduit::schema::processor_domain_polytone_t& polytone) {
            return route_through_polytone(
                polytone.polytone_note_address, polytone.timeout_seconds,
                config.authorization_contract, std::move(payload), processor,
                conduit::schema::polytone_tag_execution_id_t{
                    .execution_id = execution_id});
          },
          [&](const conduit::schema::processor_domain_hyperlane_t& hyperlane) {
            return route_through_hyperlane(
                hyperlane.mailbox, hyperlane.main_domain_id,
                config.authorization_contract, std::move(payload));
          }},
      config.processor_domain);
}

conduit::schema::address_t derive_proxy_address(
    const conduit::schema::address_t& note,
    const conduit::schema::address_t& initiator) {
  auto material = conduit::schema::key::builder{}
                      .write(std::string_view{"polytone-proxy"})
                      .write(static_cast<uint32_t>(note.size()))
                      .write(note)
                      .write(static_cast<uint32_t>(initiator.size()))
                      .write(initiator)
                      .data;
  auto digest = conduit::blake3::hash(conduit::schema::bytes_view_t{material});
  return std::string{kProxyAddressPrefix} +
         conduit::schema::to_hex(
             conduit::schema::bytes_view_t{digest.data(), 20});
}

conduit::schema::polytone_proxy_state_t next_proxy_state(
    const conduit::schema::polytone_execute_result_t& result) {
  return std::visit(
      overloaded{
          [](const conduit::schema::polytone_execute_success_t&) {
            return conduit::schema::polytone_proxy_state_t{
                .status = conduit::schema::polytone_proxy_status_t::created};
          },
          [](const conduit::schema::polytone_execute_error_t& value) {
            if (value.error == conduit::schema::kPolytoneTimeoutError) {
              return conduit::schema::polytone_proxy_state_t{
                  .status =
                      conduit::schema::polytone_proxy_status_t::timed_out};
            }
            spdlog::warn("Proxy creation failed: {}", value.error);
            return conduit::schema::polytone_proxy_state_t{
                .status =
                    conduit::schema::polytone_proxy_status_t::unexpected_error,
                .error = value.error};
          }},
      result);
}

conduit::schema::bridge_state_t bridge_state_of(
    const conduit::schema::polytone_execute_result_t& result) {
  return std::visit(
      overloaded{
          [](const conduit::schema::polytone_execute_success_t&) {
            return conduit::schema::bridge_state_t{
                .delivery = conduit::schema::bridge_delivery_t::delivered};
          },
          [](const conduit::schema::polytone_execute_error_t& value) {
            if (value.error == conduit::schema::kPolytoneTimeoutError) {
              return conduit::schema::bridge_state_t{
                  .delivery = conduit::schema::bridge_delivery_t::timed_out,
                  .error = value.error};
            }
            return conduit::schema::bridge_state_t{
                .delivery =
                    conduit::schema::bridge_delivery_t::unexpected_error,
                .error = value.error};
          }},
      result);
}

bool supports_message_type(
    const conduit::schema::execution_environment_t& environment,
    const conduit::schema::message_type_t message_type) {
  auto is_evm = message_type == conduit::schema::message_type_t::evm_call ||
                message_type == conduit::schema::message_type_t::evm_raw_call;
  return std::holds_alternative<conduit::schema::evm_environment_t>(
             environment) == is_evm;
}

std::optional<conduit::schema::polytone_callback_tag_t> decode_tag(
    const conduit::schema::bytes_view_t& bytes) {
  auto encoder = encoder_t{};
  return encoder.try_decode<conduit::schema::polytone_callback_tag_t>(bytes);
}

}  // namespace conduit::router
