#include <conduit/authorization/registry.hpp>
#include <conduit/processor/engine.hpp>
#include <conduit/router/router.hpp>
#include <conduit/schema/authorization_error_code.hpp>
#include <conduit/schema/bridge_error_code.hpp>
#include <conduit/schema/processor_error_code.hpp>
#include <conduit/schema/query_result.hpp>
#include <conduit/testing/builders.hpp>
#include <conduit/testing/chain_fixture.hpp>
#include <conduit/testing/contracts.hpp>
#include <conduit/testing/relay.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace conduit::schema;
using namespace conduit::testing;

namespace {

inline constexpr auto kMainNote = std::string_view{"note_main"};
inline constexpr auto kRemoteNote = std::string_view{"note_remote"};
inline constexpr auto kRemoteProcessor = std::string_view{"remote_processor"};
inline constexpr auto kRemoteLibrary = std::string_view{"remote_library"};
inline constexpr auto kDomainName = std::string_view{"osmosis"};

inline constexpr auto kMainMailbox = std::string_view{"mailbox_main"};
inline constexpr auto kEvmMailbox = std::string_view{"mailbox_evm"};
inline constexpr auto kEvmProcessor = std::string_view{"evm_processor"};
inline constexpr auto kEvmLibrary = std::string_view{"evm_library"};
inline constexpr auto kMainDomainId = uint32_t{1};
inline constexpr auto kEvmDomainId = uint32_t{2};

execution_id_t execution_id_of(const transaction_result_t& result) {
  return decode<execution_id_t>(result.data);
}

std::vector<processor_message_t> run_msgs() {
  return {execute_msg(R"({"run":{}})")};
}

void deploy_registry(chain_fixture& chain) {
  chain.deploy(kRegistry, std::make_shared<conduit::authorization::registry>(),
               registry_instantiate_t{.owner = std::string{kOwner},
                                      .processor = std::string{kProcessor}});
  chain.deploy(kProcessor, std::make_shared<conduit::processor::engine>(),
               processor_instantiate_t{
                   .owner = std::string{kOwner},
                   .authorization_contract = std::string{kRegistry},
                   .processor_domain = processor_domain_main_t{}});
}

/// Main chain with the registry and a CosmWasm chain whose processor is
/// reached through a pair of Polytone notes.
class polytone_fixture final {
 public:
  polytone_fixture()
      : main_{"conduit_bridge_polytone_main"},
        remote_{"conduit_bridge_polytone_remote", "conduit-remote"},
        main_note_{std::make_shared<mock_note>()},
        remote_note_{std::make_shared<mock_note>()},
        outbound_{main_, kMainNote, *main_note_, remote_},
        inbound_{remote_, kRemoteNote, *remote_note_, main_} {
    deploy_registry(main_);
    main_.deploy(kMainNote, main_note_, bytes_t{});
    remote_.deploy(kRemoteNote, remote_note_, bytes_t{});
    library_ = remote_.deploy(kRemoteLibrary, std::make_shared<test_library>(),
                              bytes_t{});
    remote_.deploy(
        kRemoteProcessor, std::make_shared<conduit::processor::engine>(),
        processor_instantiate_t{
            .owner = std::string{kOwner},
            .authorization_contract = std::string{kRegistry},
            .processor_domain = processor_domain_polytone_t{
                .polytone_proxy_address = registry_proxy(),
                .polytone_note_address = std::string{kRemoteNote},
                .timeout_seconds = 600}});
  }

  polytone_fixture(const polytone_fixture&) = delete;
  polytone_fixture& operator=(const polytone_fixture&) = delete;
  polytone_fixture(polytone_fixture&&) = delete;
  polytone_fixture& operator=(polytone_fixture&&) = delete;

  static address_t registry_proxy() {
    return conduit::router::derive_proxy_address(kMainNote, kRegistry);
  }

  static address_t processor_proxy() {
    return conduit::router::derive_proxy_address(kRemoteNote,
                                                 kRemoteProcessor);
  }

  chain_fixture& main_chain() { return main_; }
  chain_fixture& remote_chain() { return remote_; }
  mock_note& main_note() { return *main_note_; }
  mock_note& remote_note() { return *remote_note_; }
  test_library& library() { return *library_; }

  /// Main chain to remote chain.
  polytone_relay& outbound() { return outbound_; }
  /// Remote chain back to the main chain.
  polytone_relay& inbound() { return inbound_; }

  transaction_result_t register_domain() {
    return main_.execute(
        kOwner, kRegistry,
        permissioned_msg(add_external_domains_t{
            .external_domains = {external_domain_info_t{
                .name = std::string{kDomainName},
                .execution_environment = polytone_connectors_info_t{
                    .note = polytone_note_info_t{
                        .address = std::string{kMainNote},
                        .timeout_seconds = 600},
                    .proxy = processor_proxy()},
                .processor = std::string{kRemoteProcessor}}}}));
  }

  transaction_result_t create_authorization() {
    return main_.execute(
        kOwner, kRegistry,
        create_authorizations_msg({permissionless_authorization(
            "remote",
            non_atomic({make_non_atomic_function(
                kRemoteLibrary, "run", std::nullopt, std::nullopt,
                domain_external_t{.name = std::string{kDomainName}})}))}));
  }

  /// Domain registered, both proxies created, authorization in place.
  void connect() {
    ASSERT_EQ(register_domain().code, 0u);
    outbound_.relay();
    inbound_.relay();
    ASSERT_EQ(domain_state().status, polytone_proxy_status_t::created);
    ASSERT_EQ(processor_proxy_state().status,
              polytone_proxy_status_t::created);
    ASSERT_EQ(create_authorization().code, 0u);
  }

  transaction_result_t send(
      std::optional<expiration_t> ttl = std::nullopt) {
    return main_.execute(kUser, kRegistry,
                         send_msgs_msg("remote", run_msgs(), std::move(ttl)));
  }

  transaction_result_t remote_tick() {
    return remote_.execute(kStranger, kRemoteProcessor, tick_msg());
  }

  polytone_proxy_state_t domain_state() const {
    auto domain = main_.query_value<external_domain_t>(
        kRegistry, "/external_domain", json(kDomainName));
    return polytone_of(domain)->note.state;
  }

  polytone_proxy_state_t processor_proxy_state() const {
    auto config =
        remote_.query_value<processor_config_t>(kRemoteProcessor, "/config");
    return std::get<processor_domain_polytone_t>(config.processor_domain)
        .proxy_on_main_domain_state;
  }

  processor_callback_info_t callback(const execution_id_t id) const {
    return main_.query_value<processor_callback_info_t>(
        kRegistry, "/processor_callback", encode(id));
  }

  uint64_t current_executions() const {
    return main_.query_value<uint64_t>(kRegistry, "/current_executions",
                                       json("remote"));
  }

 private:
  chain_fixture main_;
  chain_fixture remote_;
  std::shared_ptr<mock_note> main_note_;
  std::shared_ptr<mock_note> remote_note_;
  std::shared_ptr<test_library> library_;
  polytone_relay outbound_;
  polytone_relay inbound_;
};

}  // namespace

TEST(bridge, polytone_proxies_are_created_through_the_notes) {
  auto fixture = polytone_fixture{};
  EXPECT_EQ(fixture.processor_proxy_state().status,
            polytone_proxy_status_t::pending_response);
  ASSERT_EQ(fixture.register_domain().code, 0u);
  EXPECT_EQ(fixture.domain_state().status,
            polytone_proxy_status_t::pending_response);
  ASSERT_EQ(fixture.main_note().pending(), 1u);

  auto outbound = fixture.outbound().relay();
  ASSERT_EQ(outbound.callbacks.size(), 1u);
  EXPECT_EQ(outbound.callbacks[0].code, 0u) << outbound.callbacks[0].log;
  EXPECT_TRUE(outbound.executions.empty());
  EXPECT_EQ(fixture.domain_state().status, polytone_proxy_status_t::created);

  auto inbound = fixture.inbound().relay();
  ASSERT_EQ(inbound.callbacks.size(), 1u);
  EXPECT_EQ(inbound.callbacks[0].code, 0u) << inbound.callbacks[0].log;
  EXPECT_EQ(fixture.processor_proxy_state().status,
            polytone_proxy_status_t::created);
}

TEST(bridge, duplicate_domains_are_rejected) {
  auto fixture = polytone_fixture{};
  ASSERT_EQ(fixture.register_domain().code, 0u);
  EXPECT_EQ(fixture.register_domain().code,
            static_cast<uint32_t>(authorization_error_code::domain_already_exists));
  auto domains = fixture.main_chain().query_value<std::vector<external_domain_t>>(
      kRegistry, "/external_domains");
  ASSERT_EQ(domains.size(), 1u);
  EXPECT_EQ(domains[0].processor, kRemoteProcessor);
  EXPECT_EQ(fixture.main_chain()
                .query(kRegistry, "/external_domain", json("nowhere"))
                .code,
            static_cast<uint32_t>(query_error_code::not_found));
}

TEST(bridge, sends_wait_for_the_proxy) {
  auto fixture = polytone_fixture{};
  ASSERT_EQ(fixture.register_domain().code, 0u);
  ASSERT_EQ(fixture.create_authorization().code, 0u);

  auto refused = fixture.send();
  EXPECT_EQ(refused.code,
            static_cast<uint32_t>(bridge_error_code::proxy_not_created));
  EXPECT_EQ(refused.codespace, kBridgeCodespace);
  EXPECT_EQ(fixture.current_executions(), 0u);
}

TEST(bridge, timed_out_proxy_creation_can_be_retried) {
  auto fixture = polytone_fixture{};
  ASSERT_EQ(fixture.register_domain().code, 0u);
  auto retry = permissionless_msg(
      retry_bridge_creation_t{.domain_name = std::string{kDomainName}});
  EXPECT_EQ(fixture.main_chain().execute(kStranger, kRegistry, retry).code,
            static_cast<uint32_t>(authorization_error_code::retry_not_allowed));

  fixture.outbound().relay(true);
  EXPECT_EQ(fixture.domain_state().status, polytone_proxy_status_t::timed_out);
  ASSERT_EQ(fixture.main_chain().execute(kStranger, kRegistry, retry).code, 0u);
  EXPECT_EQ(fixture.domain_state().status,
            polytone_proxy_status_t::pending_response);
  fixture.outbound().relay();
  EXPECT_EQ(fixture.domain_state().status, polytone_proxy_status_t::created);

  auto retry_proxy = processor_execute_msg_t{
      processor_permissionless_msg_t{retry_proxy_creation_t{}}};
  EXPECT_EQ(
      fixture.remote_chain().execute(kStranger, kRemoteProcessor, retry_proxy).code,
      static_cast<uint32_t>(processor_error_code::proxy_creation_not_retriable));
  fixture.inbound().relay(true);
  EXPECT_EQ(fixture.processor_proxy_state().status,
            polytone_proxy_status_t::timed_out);
  ASSERT_EQ(
      fixture.remote_chain().execute(kStranger, kRemoteProcessor, retry_proxy).code,
      0u);
  fixture.inbound().relay();
  EXPECT_EQ(fixture.processor_proxy_state().status,
            polytone_proxy_status_t::created);
}

TEST(bridge, polytone_execution_round_trip) {
  auto fixture = polytone_fixture{};
  fixture.connect();

  auto sent = fixture.send();
  ASSERT_EQ(sent.code, 0u) << sent.log;
  auto id = execution_id_of(sent);
  auto callback = fixture.callback(id);
  EXPECT_EQ(callback.bridge.delivery, bridge_delivery_t::pending);
  EXPECT_EQ(callback.processor_callback_address,
            polytone_fixture::processor_proxy());

  auto delivered = fixture.outbound().relay();
  ASSERT_EQ(delivered.executions.size(), 1u);
  EXPECT_EQ(delivered.executions[0].code, 0u) << delivered.executions[0].log;
  EXPECT_EQ(fixture.callback(id).bridge.delivery, bridge_delivery_t::delivered);
  EXPECT_EQ(fixture.remote_chain().query_value<bool>(kRemoteProcessor,
                                               "/is_queue_empty"),
            false);

  auto ticked = fixture.remote_tick();
  ASSERT_EQ(ticked.code, 0u) << ticked.log;
  EXPECT_EQ(fixture.remote_chain().query_value<uint64_t>(kRemoteLibrary, "/calls"),
            1u);
  EXPECT_EQ(fixture.library().senders().back(), kRemoteProcessor);
  auto pending = fixture.remote_chain().query_value<pending_bridge_callback_t>(
      kRemoteProcessor, "/pending_callback", encode(id));
  EXPECT_EQ(pending.bridge.delivery, bridge_delivery_t::pending);
  EXPECT_EQ(to_string(fixture.callback(id).execution_result), "in_process");

  auto returned = fixture.inbound().relay();
  ASSERT_EQ(returned.executions.size(), 1u);
  EXPECT_EQ(returned.executions[0].code, 0u) << returned.executions[0].log;
  EXPECT_EQ(to_string(fixture.callback(id).execution_result), "success");
  EXPECT_EQ(fixture.current_executions(), 0u);
  EXPECT_EQ(fixture.remote_chain()
                .query(kRemoteProcessor, "/pending_callback", encode(id))
                .code,
            static_cast<uint32_t>(query_error_code::not_found));
}

TEST(bridge, timed_out_delivery_can_be_resent) {
  auto fixture = polytone_fixture{};
  fixture.connect();
  auto id = execution_id_of(fixture.send());

  fixture.outbound().relay(true);
  auto callback = fixture.callback(id);
  EXPECT_EQ(to_string(callback.execution_result), "timeout(retriable=true)");
  EXPECT_EQ(callback.bridge.delivery, bridge_delivery_t::timed_out);
  EXPECT_EQ(fixture.current_executions(), 1u);

  auto resent = fixture.main_chain().execute(
      kStranger, kRegistry, permissionless_msg(retry_msgs_t{.execution_id = id}));
  ASSERT_EQ(resent.code, 0u) << resent.log;
  EXPECT_EQ(event_attribute(resent, kRegistry, "outcome"), "resent");
  EXPECT_EQ(to_string(fixture.callback(id).execution_result), "in_process");

  fixture.outbound().relay();
  ASSERT_EQ(fixture.remote_tick().code, 0u);
  fixture.inbound().relay();
  EXPECT_EQ(to_string(fixture.callback(id).execution_result), "success");
}

TEST(bridge, expired_ttl_turns_a_timeout_final) {
  auto fixture = polytone_fixture{};
  fixture.connect();
  auto id = execution_id_of(
      fixture.send(expiration_at_time_t{.time = kGenesisTime + 50}));
  fixture.outbound().relay(true);
  fixture.main_chain().advance(1, 60);

  auto retried = fixture.main_chain().execute(
      kStranger, kRegistry, permissionless_msg(retry_msgs_t{.execution_id = id}));
  ASSERT_EQ(retried.code, 0u) << retried.log;
  EXPECT_EQ(event_attribute(retried, kRegistry, "outcome"), "ttl_expired");
  EXPECT_EQ(to_string(fixture.callback(id).execution_result),
            "timeout(retriable=false)");
  EXPECT_EQ(fixture.current_executions(), 0u);
  EXPECT_EQ(fixture.main_note().pending(), 0u);
}

TEST(bridge, timed_out_callbacks_are_retried_by_the_processor) {
  auto fixture = polytone_fixture{};
  fixture.connect();
  auto id = execution_id_of(fixture.send());
  fixture.outbound().relay();
  ASSERT_EQ(fixture.remote_tick().code, 0u);
  EXPECT_EQ(fixture.remote_note().pending(), 1u);

  auto retry = processor_execute_msg_t{
      processor_permissionless_msg_t{retry_callback_t{.execution_id = id}}};
  EXPECT_EQ(fixture.remote_chain().execute(kStranger, kRemoteProcessor, retry).code,
            static_cast<uint32_t>(processor_error_code::callback_not_retriable));

  fixture.inbound().relay(true);
  auto pending = fixture.remote_chain().query_value<pending_bridge_callback_t>(
      kRemoteProcessor, "/pending_callback", encode(id));
  EXPECT_EQ(pending.bridge.delivery, bridge_delivery_t::timed_out);
  EXPECT_EQ(to_string(pending.execution_result), "success");
  EXPECT_EQ(to_string(fixture.callback(id).execution_result), "in_process");

  ASSERT_EQ(fixture.remote_chain().execute(kStranger, kRemoteProcessor, retry).code,
            0u);
  fixture.inbound().relay();
  EXPECT_EQ(to_string(fixture.callback(id).execution_result), "success");

  auto unknown = processor_execute_msg_t{
      processor_permissionless_msg_t{retry_callback_t{.execution_id = 77}}};
  EXPECT_EQ(
      fixture.remote_chain().execute(kStranger, kRemoteProcessor, unknown).code,
      static_cast<uint32_t>(processor_error_code::pending_callback_not_found));
}

TEST(bridge, bridge_callbacks_need_the_registered_note) {
  auto fixture = polytone_fixture{};
  ASSERT_EQ(fixture.register_domain().code, 0u);
  auto forged = bridge_delivery(
      kRegistry,
      polytone_callback_message_t{
          .initiator = std::string{kRegistry},
          .initiator_msg = encode(polytone_callback_tag_t{
              polytone_tag_create_proxy_t{.domain_name =
                                              std::string{kDomainName}}}),
          .result = polytone_execute_success_t{}});
  auto result = fixture.main_chain().chain().execute(
      std::string{kStranger}, std::string{kRegistry}, bytes_view_t{forged});
  EXPECT_EQ(result.code,
            static_cast<uint32_t>(bridge_error_code::unknown_bridge_sender));
  EXPECT_EQ(fixture.domain_state().status,
            polytone_proxy_status_t::pending_response);

  auto wrong_initiator = bridge_delivery(
      kRegistry, polytone_callback_message_t{
                     .initiator = std::string{kStranger},
                     .initiator_msg = bytes_t{},
                     .result = polytone_execute_success_t{}});
  EXPECT_EQ(fixture.main_chain()
                .chain()
                .execute(std::string{kMainNote}, std::string{kRegistry},
                         bytes_view_t{wrong_initiator})
                .code,
            static_cast<uint32_t>(bridge_error_code::invalid_initiator));
}

TEST(bridge, hyperlane_execution_round_trip) {
  auto main_chain = chain_fixture{"conduit_bridge_hyperlane_main"};
  auto evm = chain_fixture{"conduit_bridge_hyperlane_evm", "conduit-evm"};
  auto main_mailbox = std::make_shared<mock_mailbox>();
  auto evm_mailbox = std::make_shared<mock_mailbox>();
  deploy_registry(main_chain);
  main_chain.deploy(kMainMailbox, main_mailbox, bytes_t{});
  evm.deploy(kEvmMailbox, evm_mailbox, bytes_t{});
  evm.deploy(kEvmLibrary, std::make_shared<test_library>(), bytes_t{});
  evm.deploy(kEvmProcessor, std::make_shared<conduit::processor::engine>(),
             processor_instantiate_t{
                 .owner = std::string{kOwner},
                 .authorization_contract = std::string{kRegistry},
                 .processor_domain = processor_domain_hyperlane_t{
                     .mailbox = std::string{kEvmMailbox},
                     .main_domain_id = kMainDomainId}});

  auto registered = main_chain.execute(
      kOwner, kRegistry,
      permissioned_msg(add_external_domains_t{
          .external_domains = {external_domain_info_t{
              .name = "ethereum",
              .execution_environment = evm_environment_t{
                  .encoder = evm_encoder_t{.broker_address = "broker",
                                           .encoder_version = "1"},
                  .hyperlane = hyperlane_connector_t{
                      .mailbox = std::string{kMainMailbox},
                      .domain_id = kEvmDomainId}},
              .processor = std::string{kEvmProcessor}}}}));
  ASSERT_EQ(registered.code, 0u) << registered.log;

  auto function = make_non_atomic_function(
      kEvmLibrary, "run", std::nullopt, std::nullopt,
      domain_external_t{.name = "ethereum"});
  function.message_details.message_type = message_type_t::evm_call;
  auto created = main_chain.execute(
      kOwner, kRegistry,
      create_authorizations_msg(
          {permissionless_authorization("evm", non_atomic({function}))}));
  ASSERT_EQ(created.code, 0u) << created.log;

  auto sent = main_chain.execute(
      kUser, kRegistry,
      send_msgs_msg("evm", {evm_call_msg_t{.msg = json(R"({"run":{}})")}}));
  ASSERT_EQ(sent.code, 0u) << sent.log;
  auto id = execution_id_of(sent);
  ASSERT_EQ(main_mailbox->pending(), 1u);

  auto outbound =
      hyperlane_relay{*main_mailbox, kMainDomainId, evm, kEvmMailbox};
  auto delivered = outbound.relay();
  ASSERT_EQ(delivered.executions.size(), 1u);
  EXPECT_EQ(delivered.executions[0].code, 0u) << delivered.executions[0].log;

  ASSERT_EQ(evm.execute(kStranger, kEvmProcessor, tick_msg()).code, 0u);
  EXPECT_EQ(evm.query_value<uint64_t>(kEvmLibrary, "/calls"), 1u);
  ASSERT_EQ(evm_mailbox->pending(), 1u);

  auto inbound =
      hyperlane_relay{*evm_mailbox, kEvmDomainId, main_chain, kMainMailbox};
  auto returned = inbound.relay();
  ASSERT_EQ(returned.executions.size(), 1u);
  EXPECT_EQ(returned.executions[0].code, 0u) << returned.executions[0].log;
  auto callback = main_chain.query_value<processor_callback_info_t>(
      kRegistry, "/processor_callback", encode(id));
  EXPECT_EQ(to_string(callback.execution_result), "success");
}

TEST(bridge, hyperlane_deliveries_must_match_the_domain) {
  auto evm = chain_fixture{"conduit_bridge_hyperlane_checks", "conduit-evm"};
  evm.deploy(kEvmProcessor, std::make_shared<conduit::processor::engine>(),
             processor_instantiate_t{
                 .owner = std::string{kOwner},
                 .authorization_contract = std::string{kRegistry},
                 .processor_domain = processor_domain_hyperlane_t{
                     .mailbox = std::string{kEvmMailbox},
                     .main_domain_id = kMainDomainId}});
  auto body = encode(processor_execute_msg_t{
      authorization_module_msg_t{pause_t{}}});

  auto deliver = [&](const std::string_view via, const uint32_t origin,
                     const std::string_view sender) {
    auto delivery = bridge_delivery(
        kEvmProcessor, hyperlane_handle_t{.origin = origin,
                                          .sender = std::string{sender},
                                          .body = body});
    return evm.chain().execute(std::string{via}, std::string{kEvmProcessor},
                               bytes_view_t{delivery});
  };
  EXPECT_EQ(deliver(kStranger, kMainDomainId, kRegistry).code,
            static_cast<uint32_t>(processor_error_code::unauthorized));
  EXPECT_EQ(deliver(kEvmMailbox, kEvmDomainId, kRegistry).code,
            static_cast<uint32_t>(processor_error_code::unauthorized));
  EXPECT_EQ(deliver(kEvmMailbox, kMainDomainId, kStranger).code,
            static_cast<uint32_t>(processor_error_code::unauthorized));
  ASSERT_EQ(deliver(kEvmMailbox, kMainDomainId, kRegistry).code, 0u);
  EXPECT_EQ(evm.query_value<processor_config_t>(kEvmProcessor, "/config").state,
            processor_state_t::paused);
}
