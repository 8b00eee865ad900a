#include <conduit/schema/authorization_error_code.hpp>
#include <conduit/schema/processor_error_code.hpp>
#include <conduit/schema/query_result.hpp>
#include <conduit/testing/domain_fixture.hpp>
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace conduit::schema;
using namespace conduit::testing;

namespace {

authorization_info_t run_authorization(const std::string_view label = "swap") {
  return permissionless_authorization(
      label, non_atomic({make_non_atomic_function(kLibrary, "run")}));
}

std::vector<processor_message_t> run_msgs() {
  return {execute_msg(R"({"run":{}})")};
}

execution_id_t execution_id_of(const transaction_result_t& result) {
  return decode<execution_id_t>(result.data);
}

uint32_t code(const authorization_error_code value) {
  return static_cast<uint32_t>(value);
}

transaction_result_t as_sender(domain_fixture& fixture,
                               const std::string_view sender,
                               const registry_execute_msg_t& msg) {
  return fixture.chain().execute(sender, kRegistry, msg);
}

}  // namespace

TEST(registry, instantiate_records_roles) {
  auto fixture = domain_fixture{"conduit_registry_roles"};
  auto& chain = fixture.chain();
  EXPECT_EQ(chain.query_value<address_t>(kRegistry, "/owner"), kOwner);
  EXPECT_EQ(chain.query_value<address_t>(kRegistry, "/processor"), kProcessor);
  EXPECT_EQ(chain.query_value<std::vector<address_t>>(kRegistry, "/sub_owners"),
            std::vector<address_t>{std::string{kSubOwner}});
}

TEST(registry, only_the_owner_manages_sub_owners) {
  auto fixture = domain_fixture{"conduit_registry_sub_owners"};
  auto denied = as_sender(fixture, kSubOwner,
                          owner_msg(add_sub_owner_t{.sub_owner = "friend"}));
  EXPECT_EQ(denied.code, code(authorization_error_code::unauthorized));
  EXPECT_EQ(denied.codespace, kAuthorizationCodespace);

  auto added = as_sender(fixture, kOwner,
                         owner_msg(add_sub_owner_t{.sub_owner = "friend"}));
  ASSERT_EQ(added.code, 0u) << added.log;
  auto removed = as_sender(
      fixture, kOwner,
      owner_msg(remove_sub_owner_t{.sub_owner = std::string{kSubOwner}}));
  ASSERT_EQ(removed.code, 0u) << removed.log;
  EXPECT_EQ(fixture.chain().query_value<std::vector<address_t>>(kRegistry,
                                                                "/sub_owners"),
            std::vector<address_t>{"friend"});

  auto revoked = as_sender(fixture, kSubOwner,
                           create_authorizations_msg({run_authorization()}));
  EXPECT_EQ(revoked.code, code(authorization_error_code::unauthorized));
}

TEST(registry, permissioned_actions_need_owner_or_sub_owner) {
  auto fixture = domain_fixture{"conduit_registry_permissioned"};
  auto denied = as_sender(fixture, kStranger,
                          create_authorizations_msg({run_authorization()}));
  EXPECT_EQ(denied.code, code(authorization_error_code::unauthorized));

  auto created = as_sender(fixture, kSubOwner,
                           create_authorizations_msg({run_authorization()}));
  ASSERT_EQ(created.code, 0u) << created.log;
  EXPECT_EQ(event_attribute(created, kRegistry, "label"), "swap");
}

TEST(registry, create_rejects_invalid_definitions) {
  auto fixture = domain_fixture{"conduit_registry_create"};
  ASSERT_EQ(fixture.create(run_authorization()).code, 0u);
  EXPECT_EQ(fixture.create(run_authorization()).code,
            code(authorization_error_code::label_already_exists));

  auto remote = permissionless_authorization(
      "remote", non_atomic({make_non_atomic_function(
                    "remote_library", "run", std::nullopt, std::nullopt,
                    domain_external_t{.name = "osmosis"})}));
  EXPECT_EQ(fixture.create(remote).code,
            code(authorization_error_code::domain_not_registered));

  auto evm = permissionless_authorization(
      "evm", atomic({make_atomic_function(kLibrary, "run")}));
  std::get<atomic_subroutine_t>(evm.subroutine)
      .functions[0]
      .message_details.message_type = message_type_t::evm_call;
  EXPECT_EQ(fixture.create(evm).code,
            code(authorization_error_code::unsupported_message_type));
}

TEST(registry, batch_creation_is_all_or_nothing) {
  auto fixture = domain_fixture{"conduit_registry_batch_create"};
  auto result = fixture.chain().execute(
      kOwner, kRegistry,
      create_authorizations_msg(
          {run_authorization("first"), run_authorization("")}));
  EXPECT_EQ(result.code, code(authorization_error_code::empty_label));
  auto page = fixture.chain().query_value<std::vector<authorization_t>>(
      kRegistry, "/authorizations");
  EXPECT_TRUE(page.empty());
}

TEST(registry, send_reaches_the_processor_queue) {
  auto fixture = domain_fixture{"conduit_registry_send"};
  ASSERT_EQ(fixture.create(run_authorization()).code, 0u);

  auto sent = fixture.send(kUser, "swap", run_msgs());
  ASSERT_EQ(sent.code, 0u) << sent.log;
  auto id = execution_id_of(sent);
  EXPECT_EQ(id, 1u);
  EXPECT_EQ(event_attribute(sent, kProcessor, "method"), "enqueue_msgs");

  auto queue = fixture.queue();
  ASSERT_EQ(queue.size(), 1u);
  EXPECT_EQ(queue[0].execution_id, id);

  auto callback = fixture.callback(id);
  EXPECT_EQ(callback.label, "swap");
  EXPECT_EQ(callback.initiator, kUser);
  EXPECT_EQ(callback.processor_callback_address, kProcessor);
  EXPECT_EQ(to_string(callback.execution_result), "in_process");
  EXPECT_EQ(callback.bridge.delivery, bridge_delivery_t::none);
  EXPECT_EQ(callback.created_at_height, 1u);
  EXPECT_EQ(fixture.current_executions("swap"), 1u);
}

TEST(registry, send_checks_label_state_and_window) {
  auto fixture = domain_fixture{"conduit_registry_window"};
  EXPECT_EQ(fixture.send(kUser, "missing", run_msgs()).code,
            code(authorization_error_code::authorization_not_found));

  auto later = run_authorization("later");
  later.not_before = expiration_at_time_t{.time = kGenesisTime + 100};
  later.duration = lifetime_seconds_t{.seconds = 200};
  later.max_concurrent_executions = 10;
  ASSERT_EQ(fixture.create(later).code, 0u);

  EXPECT_EQ(fixture.send(kUser, "later", run_msgs()).code,
            code(authorization_error_code::authorization_not_active_yet));
  fixture.chain().advance(1, 100);
  EXPECT_EQ(fixture.send(kUser, "later", run_msgs()).code, 0u);
  fixture.chain().advance(1, 100);
  EXPECT_EQ(fixture.send(kUser, "later", run_msgs()).code,
            code(authorization_error_code::authorization_expired));
}

TEST(registry, disabled_authorizations_refuse_sends) {
  auto fixture = domain_fixture{"conduit_registry_disabled"};
  ASSERT_EQ(fixture.create(run_authorization()).code, 0u);

  ASSERT_EQ(as_sender(fixture, kOwner,
                      permissioned_msg(disable_authorization_t{.label = "swap"}))
                .code,
            0u);
  EXPECT_EQ(fixture.send(kUser, "swap", run_msgs()).code,
            code(authorization_error_code::authorization_disabled));

  ASSERT_EQ(as_sender(fixture, kOwner,
                      permissioned_msg(enable_authorization_t{.label = "swap"}))
                .code,
            0u);
  EXPECT_EQ(fixture.send(kUser, "swap", run_msgs()).code, 0u);
}

TEST(registry, messages_must_match_the_subroutine) {
  auto fixture = domain_fixture{"conduit_registry_messages"};
  ASSERT_EQ(fixture.create(run_authorization()).code, 0u);
  EXPECT_EQ(fixture.send(kUser, "swap", {execute_msg(R"({"walk":{}})")}).code,
            code(authorization_error_code::message_does_not_match));
  EXPECT_EQ(fixture.send(kUser, "swap", {}).code,
            code(authorization_error_code::invalid_message_amount));
  EXPECT_EQ(fixture.current_executions("swap"), 0u);
  EXPECT_TRUE(fixture.queue().empty());
}

TEST(registry, concurrency_limit_holds_until_the_callback) {
  auto fixture = domain_fixture{"conduit_registry_concurrency"};
  ASSERT_EQ(fixture.create(run_authorization()).code, 0u);

  auto first = fixture.send(kUser, "swap", run_msgs());
  ASSERT_EQ(first.code, 0u);
  EXPECT_EQ(fixture.send(kUser, "swap", run_msgs()).code,
            code(authorization_error_code::concurrency_limit_reached));

  ASSERT_EQ(fixture.tick().code, 0u);
  EXPECT_EQ(to_string(fixture.result_of(execution_id_of(first))), "success");
  EXPECT_EQ(fixture.current_executions("swap"), 0u);
  EXPECT_EQ(fixture.send(kUser, "swap", run_msgs()).code, 0u);
}

TEST(registry, call_limited_mints_are_consumed) {
  auto fixture = domain_fixture{"conduit_registry_call_limit"};
  auto info = call_limited_authorization(
      "limited", non_atomic({make_non_atomic_function(kLibrary, "run")}),
      {address_allowance_t{.address = std::string{kUser}, .amount = 1}});
  info.max_concurrent_executions = 5;
  ASSERT_EQ(fixture.create(info).code, 0u);
  EXPECT_EQ(fixture.mint_balance("limited", kUser), 1);

  EXPECT_EQ(fixture.send(kStranger, "limited", run_msgs()).code,
            code(authorization_error_code::not_allowed));
  ASSERT_EQ(fixture.send(kUser, "limited", run_msgs()).code, 0u);
  EXPECT_EQ(fixture.mint_balance("limited", kUser), 0);
  EXPECT_EQ(fixture.send(kUser, "limited", run_msgs()).code,
            code(authorization_error_code::not_allowed));

  ASSERT_EQ(fixture.tick().code, 0u);
  EXPECT_EQ(fixture.mint_balance("limited", kUser), 0);
}

TEST(registry, mints_are_refunded_when_nothing_ran) {
  auto fixture = domain_fixture{"conduit_registry_refund"};
  auto info = call_limited_authorization(
      "limited", non_atomic({make_non_atomic_function(kLibrary, "run")}),
      {address_allowance_t{.address = std::string{kUser}, .amount = 1}});
  ASSERT_EQ(fixture.create(info).code, 0u);

  auto sent = fixture.send(kUser, "limited", run_msgs());
  ASSERT_EQ(sent.code, 0u);
  fixture.library().fail_next(1);
  ASSERT_EQ(fixture.tick().code, 0u);

  EXPECT_EQ(to_string(fixture.result_of(execution_id_of(sent))),
            "partially_executed(0, transient failure)");
  EXPECT_EQ(fixture.mint_balance("limited", kUser), 1);
  EXPECT_EQ(fixture.current_executions("limited"), 0u);
}

TEST(registry, unlimited_permissions_keep_their_mint) {
  auto fixture = domain_fixture{"conduit_registry_unlimited"};
  auto info = unlimited_authorization(
      "open", non_atomic({make_non_atomic_function(kLibrary, "run")}),
      {std::string{kUser}});
  info.max_concurrent_executions = 3;
  ASSERT_EQ(fixture.create(info).code, 0u);

  ASSERT_EQ(fixture.send(kUser, "open", run_msgs()).code, 0u);
  ASSERT_EQ(fixture.send(kUser, "open", run_msgs()).code, 0u);
  EXPECT_EQ(fixture.mint_balance("open", kUser), 1);
  EXPECT_EQ(fixture.current_executions("open"), 2u);
}

TEST(registry, mint_requires_a_permissioned_authorization) {
  auto fixture = domain_fixture{"conduit_registry_mint"};
  ASSERT_EQ(fixture.create(run_authorization()).code, 0u);
  auto rejected = as_sender(
      fixture, kOwner,
      permissioned_msg(mint_authorizations_t{
          .label = "swap",
          .mints = {address_allowance_t{.address = std::string{kUser},
                                        .amount = 1}}}));
  EXPECT_EQ(rejected.code, code(authorization_error_code::cannot_mint_permissionless));

  auto info = call_limited_authorization(
      "limited", non_atomic({make_non_atomic_function(kLibrary, "run")}), {});
  ASSERT_EQ(fixture.create(info).code, 0u);
  auto minted = as_sender(
      fixture, kSubOwner,
      permissioned_msg(mint_authorizations_t{
          .label = "limited",
          .mints = {address_allowance_t{.address = std::string{kUser},
                                        .amount = 2},
                    address_allowance_t{.address = std::string{kUser},
                                        .amount = 3}}}));
  ASSERT_EQ(minted.code, 0u) << minted.log;
  EXPECT_EQ(fixture.mint_balance("limited", kUser), 5);
}

TEST(registry, modify_validates_updates) {
  auto fixture = domain_fixture{"conduit_registry_modify"};
  ASSERT_EQ(fixture.create(run_authorization()).code, 0u);

  EXPECT_EQ(as_sender(fixture, kOwner,
                      permissioned_msg(modify_authorization_t{
                          .label = "swap", .priority = priority_t::high}))
                .code,
            code(authorization_error_code::permissionless_with_high_priority));
  EXPECT_EQ(as_sender(fixture, kOwner,
                      permissioned_msg(modify_authorization_t{
                          .label = "swap", .max_concurrent_executions = 0}))
                .code,
            code(authorization_error_code::invalid_max_concurrent_executions));
  EXPECT_EQ(as_sender(fixture, kOwner,
                      permissioned_msg(modify_authorization_t{.label = "nope"}))
                .code,
            code(authorization_error_code::authorization_not_found));

  auto modified = as_sender(
      fixture, kOwner,
      permissioned_msg(modify_authorization_t{
          .label = "swap",
          .expiration = expiration_at_height_t{.height = 10},
          .max_concurrent_executions = 4}));
  ASSERT_EQ(modified.code, 0u) << modified.log;
  auto page = fixture.chain().query_value<std::vector<authorization_t>>(
      kRegistry, "/authorizations");
  ASSERT_EQ(page.size(), 1u);
  EXPECT_EQ(page[0].max_concurrent_executions, 4u);
  EXPECT_EQ(to_string(page[0].expiration), "height:10");
}

TEST(registry, authorizations_are_paginated_by_label) {
  auto fixture = domain_fixture{"conduit_registry_pages"};
  for (const auto* label : {"c", "a", "b"}) {
    ASSERT_EQ(fixture.create(run_authorization(label)).code, 0u);
  }
  auto page = fixture.chain().query_value<std::vector<authorization_t>>(
      kRegistry, "/authorizations",
      encode(page_request_t{.start_after = std::string{"a"}, .limit = 1}));
  ASSERT_EQ(page.size(), 1u);
  EXPECT_EQ(page[0].label, "b");

  auto all = fixture.chain().query_value<std::vector<authorization_t>>(
      kRegistry, "/authorizations");
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].label, "a");
  EXPECT_EQ(all[2].label, "c");
}

TEST(registry, callbacks_are_paginated_by_execution_id) {
  auto fixture = domain_fixture{"conduit_registry_callback_pages"};
  auto info = run_authorization();
  info.max_concurrent_executions = 5;
  ASSERT_EQ(fixture.create(info).code, 0u);
  for (auto i = 0; i < 3; ++i) {
    ASSERT_EQ(fixture.send(kUser, "swap", run_msgs()).code, 0u);
  }
  auto page = fixture.chain().query_value<std::vector<processor_callback_info_t>>(
      kRegistry, "/processor_callbacks",
      encode(id_page_request_t{.start_after = execution_id_t{1}, .limit = 5}));
  ASSERT_EQ(page.size(), 2u);
  EXPECT_EQ(page[0].execution_id, 2u);
  EXPECT_EQ(page[1].execution_id, 3u);

  auto missing = fixture.chain().query(kRegistry, "/processor_callback",
                                       encode(execution_id_t{42}));
  EXPECT_EQ(missing.code, static_cast<uint32_t>(query_error_code::not_found));
  auto unsupported = fixture.chain().query(kRegistry, "/nothing");
  EXPECT_EQ(unsupported.code,
            static_cast<uint32_t>(query_error_code::unknown_path));
}

TEST(registry, only_the_recorded_processor_reports_results) {
  auto fixture = domain_fixture{"conduit_registry_callback_sender"};
  ASSERT_EQ(fixture.create(run_authorization()).code, 0u);
  auto id = execution_id_of(fixture.send(kUser, "swap", run_msgs()));

  auto report = permissionless_msg(processor_callback_t{
      .execution_id = id, .execution_result = result_success_t{}});
  EXPECT_EQ(as_sender(fixture, kStranger, report).code,
            code(authorization_error_code::unauthorized_callback_sender));

  auto unknown = permissionless_msg(processor_callback_t{
      .execution_id = 99, .execution_result = result_success_t{}});
  EXPECT_EQ(as_sender(fixture, kProcessor, unknown).code,
            code(authorization_error_code::callback_not_found));
  EXPECT_EQ(to_string(fixture.result_of(id)), "in_process");
}

TEST(registry, settled_results_ignore_late_reports) {
  auto fixture = domain_fixture{"conduit_registry_settled"};
  ASSERT_EQ(fixture.create(run_authorization()).code, 0u);
  auto id = execution_id_of(fixture.send(kUser, "swap", run_msgs()));
  ASSERT_EQ(fixture.tick().code, 0u);
  ASSERT_EQ(to_string(fixture.result_of(id)), "success");

  auto late = as_sender(
      fixture, kProcessor,
      permissionless_msg(processor_callback_t{
          .execution_id = id,
          .execution_result = result_rejected_t{.error = "late"}}));
  ASSERT_EQ(late.code, 0u) << late.log;
  EXPECT_EQ(event_attribute(late, kRegistry, "outcome"), "already_settled");
  EXPECT_EQ(to_string(fixture.result_of(id)), "success");
  EXPECT_EQ(fixture.current_executions("swap"), 0u);
}

TEST(registry, repeated_callbacks_refund_and_release_once) {
  auto fixture = domain_fixture{"conduit_registry_repeated_callback"};
  auto info = call_limited_authorization(
      "limited", non_atomic({make_non_atomic_function(kLibrary, "run")}),
      {address_allowance_t{.address = std::string{kUser}, .amount = 2}});
  info.max_concurrent_executions = 2;
  ASSERT_EQ(fixture.create(info).code, 0u);
  auto id = execution_id_of(fixture.send(kUser, "limited", run_msgs()));
  ASSERT_EQ(fixture.send(kUser, "limited", run_msgs()).code, 0u);
  EXPECT_EQ(fixture.mint_balance("limited", kUser), 0);
  EXPECT_EQ(fixture.current_executions("limited"), 2u);

  auto report = permissionless_msg(processor_callback_t{
      .execution_id = id,
      .execution_result = result_rejected_t{.error = "library failure"}});
  auto first = as_sender(fixture, kProcessor, report);
  ASSERT_EQ(first.code, 0u) << first.log;
  EXPECT_EQ(fixture.mint_balance("limited", kUser), 1);
  EXPECT_EQ(fixture.current_executions("limited"), 1u);

  auto repeated = as_sender(fixture, kProcessor, report);
  ASSERT_EQ(repeated.code, 0u) << repeated.log;
  EXPECT_EQ(event_attribute(repeated, kRegistry, "outcome"), "already_settled");
  EXPECT_EQ(fixture.mint_balance("limited", kUser), 1);
  EXPECT_EQ(fixture.current_executions("limited"), 1u);
  EXPECT_EQ(to_string(fixture.result_of(id)), "rejected(library failure)");
}

TEST(registry, add_msgs_inserts_at_a_queue_position) {
  auto fixture = domain_fixture{"conduit_registry_add_msgs"};
  ASSERT_EQ(fixture.create(run_authorization()).code, 0u);
  auto sent = execution_id_of(fixture.send(kUser, "swap", run_msgs()));

  auto denied = as_sender(fixture, kUser,
                          permissioned_msg(add_msgs_t{.label = "swap",
                                                      .queue_position = 0,
                                                      .messages = run_msgs()}));
  EXPECT_EQ(denied.code, code(authorization_error_code::unauthorized));

  auto added = as_sender(fixture, kOwner,
                         permissioned_msg(add_msgs_t{.label = "swap",
                                                     .queue_position = 0,
                                                     .messages = run_msgs()}));
  ASSERT_EQ(added.code, 0u) << added.log;
  auto inserted = execution_id_of(added);

  auto queue = fixture.queue();
  ASSERT_EQ(queue.size(), 2u);
  EXPECT_EQ(queue[0].execution_id, inserted);
  EXPECT_EQ(queue[1].execution_id, sent);
  EXPECT_EQ(fixture.current_executions("swap"), 1u);

  auto beyond = as_sender(fixture, kOwner,
                          permissioned_msg(add_msgs_t{.label = "swap",
                                                      .queue_position = 9,
                                                      .messages = run_msgs()}));
  EXPECT_EQ(beyond.code, static_cast<uint32_t>(
                             processor_error_code::queue_position_out_of_range));
}

TEST(registry, remove_msgs_reports_removal_and_refunds) {
  auto fixture = domain_fixture{"conduit_registry_remove_msgs"};
  auto info = call_limited_authorization(
      "limited", non_atomic({make_non_atomic_function(kLibrary, "run")}),
      {address_allowance_t{.address = std::string{kUser}, .amount = 1}});
  ASSERT_EQ(fixture.create(info).code, 0u);
  auto id = execution_id_of(fixture.send(kUser, "limited", run_msgs()));

  auto removed = as_sender(
      fixture, kOwner,
      permissioned_msg(remove_msgs_t{.domain = domain_main_t{},
                                     .queue_position = 0}));
  ASSERT_EQ(removed.code, 0u) << removed.log;
  EXPECT_TRUE(fixture.queue().empty());
  EXPECT_EQ(to_string(fixture.result_of(id)), "removed_by_owner");
  EXPECT_EQ(fixture.mint_balance("limited", kUser), 1);
  EXPECT_EQ(fixture.current_executions("limited"), 0u);
}

TEST(registry, pause_and_resume_are_forwarded) {
  auto fixture = domain_fixture{"conduit_registry_pause"};
  ASSERT_EQ(fixture.create(run_authorization()).code, 0u);
  auto id = execution_id_of(fixture.send(kUser, "swap", run_msgs()));

  ASSERT_EQ(as_sender(fixture, kOwner,
                      permissioned_msg(pause_processor_t{.domain = domain_main_t{}}))
                .code,
            0u);
  EXPECT_EQ(fixture.tick().code,
            static_cast<uint32_t>(processor_error_code::processor_paused));

  ASSERT_EQ(as_sender(fixture, kOwner,
                      permissioned_msg(resume_processor_t{.domain = domain_main_t{}}))
                .code,
            0u);
  ASSERT_EQ(fixture.tick().code, 0u);
  EXPECT_EQ(to_string(fixture.result_of(id)), "success");
}

TEST(registry, only_retriable_timeouts_can_be_retried) {
  auto fixture = domain_fixture{"conduit_registry_retry"};
  ASSERT_EQ(fixture.create(run_authorization()).code, 0u);
  auto id = execution_id_of(fixture.send(kUser, "swap", run_msgs()));

  EXPECT_EQ(as_sender(fixture, kStranger,
                      permissionless_msg(retry_msgs_t{.execution_id = id}))
                .code,
            code(authorization_error_code::retry_not_allowed));
  EXPECT_EQ(as_sender(fixture, kStranger,
                      permissionless_msg(retry_msgs_t{.execution_id = 77}))
                .code,
            code(authorization_error_code::callback_not_found));
}

TEST(registry, undecodable_messages_are_rejected) {
  auto fixture = domain_fixture{"conduit_registry_garbage"};
  auto garbage = bytes_t{0xFF, 0xFF};
  auto result = fixture.chain().chain().execute(
      std::string{kOwner}, std::string{kRegistry}, bytes_view_t{garbage});
  EXPECT_EQ(result.code, code(authorization_error_code::invalid_message));
}
