#include <conduit/router/router.hpp>
#include <conduit/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>

using namespace conduit::schema;
using namespace conduit::testing;

namespace {

external_domain_t polytone_domain() {
  return external_domain_t{
      .name = "osmosis",
      .execution_environment = cosmwasm_environment_t{
          .polytone = polytone_connectors_t{
              .note = polytone_note_t{.address = "note",
                                      .timeout_seconds = 600,
                                      .state = polytone_proxy_state_t{
                                          .status = polytone_proxy_status_t::
                                              created}},
              .proxy = "proxy_on_main"}},
      .processor = "remote_processor"};
}

external_domain_t hyperlane_domain() {
  return external_domain_t{
      .name = "ethereum",
      .execution_environment =
          evm_environment_t{.encoder = evm_encoder_t{.broker_address = "broker",
                                                     .encoder_version = "1"},
                            .hyperlane = hyperlane_connector_t{
                                .mailbox = "mailbox", .domain_id = 1}},
      .processor = "evm_processor"};
}

const wasm_execute_t& as_execute(const cosmos_msg_t& msg) {
  return std::get<wasm_execute_t>(msg);
}

}  // namespace

TEST(router, main_domain_executes_the_processor_directly) {
  auto payload = json("payload");
  auto msg = conduit::router::route_to_main("processor", payload);
  EXPECT_EQ(as_execute(msg).contract_address, "processor");
  EXPECT_EQ(as_execute(msg).msg, payload);
}

TEST(router, polytone_delivery_carries_the_payload_and_tag) {
  auto payload = json("payload");
  auto msg = conduit::router::route_to_external(polytone_domain(), payload,
                                                "registry", execution_id_t{9});
  EXPECT_EQ(as_execute(msg).contract_address, "note");

  auto execute = decode<polytone_execute_t>(as_execute(msg).msg);
  EXPECT_EQ(execute.timeout_seconds, 600u);
  ASSERT_EQ(execute.msgs.size(), 1u);
  EXPECT_EQ(target_of(execute.msgs[0]), "remote_processor");
  EXPECT_EQ(as_execute(execute.msgs[0]).msg, payload);

  ASSERT_TRUE(execute.callback.has_value());
  EXPECT_EQ(execute.callback->receiver, "registry");
  auto tag = conduit::router::decode_tag(execute.callback->msg);
  ASSERT_TRUE(tag.has_value());
  ASSERT_TRUE(std::holds_alternative<polytone_tag_execution_id_t>(*tag));
  EXPECT_EQ(std::get<polytone_tag_execution_id_t>(*tag).execution_id, 9u);
}

TEST(router, untracked_polytone_delivery_has_no_callback) {
  auto msg = conduit::router::route_to_external(polytone_domain(), json("x"),
                                                "registry", std::nullopt);
  auto execute = decode<polytone_execute_t>(as_execute(msg).msg);
  EXPECT_FALSE(execute.callback.has_value());
}

TEST(router, hyperlane_delivery_dispatches_through_the_mailbox) {
  auto payload = json("payload");
  auto msg = conduit::router::route_to_external(hyperlane_domain(), payload,
                                                "registry", execution_id_t{3});
  EXPECT_EQ(as_execute(msg).contract_address, "mailbox");
  auto dispatch = decode<hyperlane_dispatch_t>(as_execute(msg).msg);
  EXPECT_EQ(dispatch.destination_domain, 1u);
  EXPECT_EQ(dispatch.recipient, "evm_processor");
  EXPECT_EQ(dispatch.body, payload);
}

TEST(router, create_proxy_message_sends_no_messages) {
  auto msg = conduit::router::create_proxy_message(
      "note", 30, "registry",
      polytone_tag_create_proxy_t{.domain_name = "osmosis"});
  auto execute = decode<polytone_execute_t>(as_execute(msg).msg);
  EXPECT_TRUE(execute.msgs.empty());
  ASSERT_TRUE(execute.callback.has_value());
  auto tag = conduit::router::decode_tag(execute.callback->msg);
  ASSERT_TRUE(tag.has_value());
  EXPECT_EQ(std::get<polytone_tag_create_proxy_t>(*tag).domain_name, "osmosis");
}

TEST(router, callbacks_follow_the_processor_domain) {
  auto payload = json("callback");
  auto main_config = processor_config_t{.authorization_contract = "registry",
                                        .processor_domain =
                                            processor_domain_main_t{}};
  auto direct = conduit::router::route_callback(main_config, "processor",
                                                payload, 4);
  EXPECT_EQ(as_execute(direct).contract_address, "registry");
  EXPECT_EQ(as_execute(direct).msg, payload);

  auto polytone_config = processor_config_t{
      .authorization_contract = "registry",
      .processor_domain = processor_domain_polytone_t{
          .polytone_proxy_address = "registry_proxy",
          .polytone_note_address = "remote_note",
          .timeout_seconds = 90}};
  auto bridged = conduit::router::route_callback(
      polytone_config, "remote_processor", payload, 4);
  EXPECT_EQ(as_execute(bridged).contract_address, "remote_note");
  auto execute = decode<polytone_execute_t>(as_execute(bridged).msg);
  ASSERT_EQ(execute.msgs.size(), 1u);
  EXPECT_EQ(target_of(execute.msgs[0]), "registry");
  ASSERT_TRUE(execute.callback.has_value());
  EXPECT_EQ(execute.callback->receiver, "remote_processor");

  auto hyperlane_config = processor_config_t{
      .authorization_contract = "registry",
      .processor_domain =
          processor_domain_hyperlane_t{.mailbox = "evm_mailbox",
                                       .main_domain_id = 7}};
  auto mailed = conduit::router::route_callback(hyperlane_config,
                                                "evm_processor", payload, 4);
  EXPECT_EQ(as_execute(mailed).contract_address, "evm_mailbox");
  auto dispatch = decode<hyperlane_dispatch_t>(as_execute(mailed).msg);
  EXPECT_EQ(dispatch.destination_domain, 7u);
  EXPECT_EQ(dispatch.recipient, "registry");
}

TEST(router, proxy_addresses_are_deterministic_per_pair) {
  auto first = conduit::router::derive_proxy_address("note", "registry");
  EXPECT_EQ(first, conduit::router::derive_proxy_address("note", "registry"));
  EXPECT_NE(first, conduit::router::derive_proxy_address("note", "processor"));
  EXPECT_NE(first, conduit::router::derive_proxy_address("note2", "registry"));
  EXPECT_EQ(first.rfind(conduit::router::kProxyAddressPrefix, 0), 0u);
  EXPECT_EQ(first.size(), conduit::router::kProxyAddressPrefix.size() + 40);
  // Length prefixes keep concatenation ambiguities apart.
  EXPECT_NE(conduit::router::derive_proxy_address("ab", "c"),
            conduit::router::derive_proxy_address("a", "bc"));
}

TEST(router, bridge_results_map_to_states) {
  auto success = polytone_execute_result_t{polytone_execute_success_t{}};
  auto timeout = polytone_execute_result_t{
      polytone_execute_error_t{.error = std::string{kPolytoneTimeoutError}}};
  auto failure =
      polytone_execute_result_t{polytone_execute_error_t{.error = "boom"}};

  EXPECT_EQ(conduit::router::next_proxy_state(success).status,
            polytone_proxy_status_t::created);
  EXPECT_EQ(conduit::router::next_proxy_state(timeout).status,
            polytone_proxy_status_t::timed_out);
  auto failed = conduit::router::next_proxy_state(failure);
  EXPECT_EQ(failed.status, polytone_proxy_status_t::unexpected_error);
  EXPECT_EQ(failed.error, "boom");

  EXPECT_EQ(conduit::router::bridge_state_of(success).delivery,
            bridge_delivery_t::delivered);
  EXPECT_EQ(conduit::router::bridge_state_of(timeout).delivery,
            bridge_delivery_t::timed_out);
  EXPECT_EQ(conduit::router::bridge_state_of(failure).delivery,
            bridge_delivery_t::unexpected_error);
}

TEST(router, environments_accept_their_own_message_types) {
  auto cosmwasm = execution_environment_t{cosmwasm_environment_t{}};
  auto evm = execution_environment_t{evm_environment_t{}};
  EXPECT_TRUE(conduit::router::supports_message_type(
      cosmwasm, message_type_t::cosmwasm_execute_msg));
  EXPECT_TRUE(conduit::router::supports_message_type(
      cosmwasm, message_type_t::cosmwasm_migrate_msg));
  EXPECT_FALSE(conduit::router::supports_message_type(cosmwasm,
                                                      message_type_t::evm_call));
  EXPECT_TRUE(conduit::router::supports_message_type(
      evm, message_type_t::evm_raw_call));
  EXPECT_FALSE(conduit::router::supports_message_type(
      evm, message_type_t::cosmwasm_execute_msg));
}

TEST(router, malformed_tags_are_rejected) {
  auto garbage = bytes_t{0x07, 0x01};
  EXPECT_FALSE(conduit::router::decode_tag(garbage).has_value());
}
