#include <conduit/schema/authorization_msg.hpp>
#include <conduit/schema/primitives.hpp>
#include <conduit/schema/processor_msg.hpp>
#include <conduit/schema/transaction.hpp>
#include <conduit/testing/domain_fixture.hpp>
#include <gtest/gtest.h>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <sys/wait.h>

#ifndef CONDUIT_TX_BUILDER_PATH
#define CONDUIT_TX_BUILDER_PATH ""
#endif

using namespace conduit::schema;
using namespace conduit::testing;

namespace {

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string builder_path() {
  return std::string{CONDUIT_TX_BUILDER_PATH};
}

bool builder_available() {
  auto builder = builder_path();
  return !builder.empty() && std::filesystem::exists(builder);
}

/// Base64 transaction line printed by the builder.
std::string build(const std::string_view args) {
  auto command = shell_quote(builder_path()) + " " + std::string{args} +
                 " 2>/dev/null";
  auto [exit_code, output] = run_capture(command);
  EXPECT_EQ(exit_code, 0) << "command failed: " << command << '\n' << output;
  return trim_ascii_whitespace(output);
}

transaction_t decode_line(const std::string& line) {
  return decode<transaction_t>(from_base64(line));
}

}  // namespace

TEST(tx_builder, tick_targets_the_processor) {
  if (!builder_available()) {
    GTEST_SKIP() << "conduit_tx_builder binary not available: "
                 << builder_path();
  }

  auto transaction =
      decode_line(build("tick --sender keeper --chain-id conduit-test"));
  EXPECT_EQ(transaction.chain_id, "conduit-test");
  EXPECT_EQ(transaction.sender, "keeper");
  EXPECT_EQ(transaction.contract, "processor");
  auto msg = decode<processor_execute_msg_t>(transaction.msg);
  ASSERT_TRUE(std::holds_alternative<processor_permissionless_msg_t>(msg));
  EXPECT_TRUE(std::holds_alternative<tick_t>(
      std::get<processor_permissionless_msg_t>(msg)));
}

TEST(tx_builder, registry_messages_carry_their_arguments) {
  if (!builder_available()) {
    GTEST_SKIP() << "conduit_tx_builder binary not available: "
                 << builder_path();
  }

  auto send = decode_line(build(
      "send-msgs --sender user --label swap --message '{\"run\":{}}' "
      "--ttl-height 40"));
  EXPECT_EQ(send.contract, "registry");
  auto send_msg = decode<registry_execute_msg_t>(send.msg);
  const auto& permissionless = std::get<permissionless_msg_t>(send_msg);
  const auto& send_msgs = std::get<send_msgs_t>(permissionless);
  EXPECT_EQ(send_msgs.label, "swap");
  ASSERT_EQ(send_msgs.messages.size(), 1u);
  EXPECT_EQ(make_string(payload_of(send_msgs.messages[0])), "{\"run\":{}}");
  ASSERT_TRUE(send_msgs.ttl.has_value());
  EXPECT_EQ(to_string(*send_msgs.ttl), "height:40");

  auto pause = decode_line(build("pause --domain osmosis"));
  auto pause_msg = decode<registry_execute_msg_t>(pause.msg);
  const auto& paused =
      std::get<pause_processor_t>(std::get<permissioned_msg_t>(pause_msg));
  EXPECT_EQ(to_string(paused.domain), "external:osmosis");

  auto domain = decode_line(
      build("add-domain --domain-name osmosis --domain-processor remote "
            "--note note_main --proxy proxy_main --timeout-seconds 90"));
  auto domain_msg = decode<registry_execute_msg_t>(domain.msg);
  const auto& added = std::get<add_external_domains_t>(
      std::get<permissioned_msg_t>(domain_msg));
  ASSERT_EQ(added.external_domains.size(), 1u);
  EXPECT_EQ(added.external_domains[0].processor, "remote");
  const auto& polytone = std::get<polytone_connectors_info_t>(
      added.external_domains[0].execution_environment);
  EXPECT_EQ(polytone.note.address, "note_main");
  EXPECT_EQ(polytone.note.timeout_seconds, 90u);
}

TEST(tx_builder, unknown_commands_fail) {
  if (!builder_available()) {
    GTEST_SKIP() << "conduit_tx_builder binary not available: "
                 << builder_path();
  }

  auto [exit_code, output] = run_capture(shell_quote(builder_path()) +
                                         " launch 2>/dev/null");
  EXPECT_NE(exit_code, 0) << output;
}

TEST(tx_builder, built_transactions_execute_on_chain) {
  if (!builder_available()) {
    GTEST_SKIP() << "conduit_tx_builder binary not available: "
                 << builder_path();
  }

  auto fixture = domain_fixture{"conduit_tx_builder"};
  auto& chain = fixture.chain().chain();
  auto submit = [&](const std::string& line) {
    auto encoded = from_base64(line);
    return chain.submit(bytes_view_t{encoded});
  };

  auto created = submit(build(
      "create-authorization --label swap --library library --method run"));
  ASSERT_EQ(created.code, 0u) << created.log;

  auto sent = submit(
      build("send-msgs --sender user --label swap --message '{\"run\":{}}'"));
  ASSERT_EQ(sent.code, 0u) << sent.log;
  EXPECT_EQ(fixture.queue().size(), 1u);

  auto ticked = submit(build("tick --sender keeper"));
  ASSERT_EQ(ticked.code, 0u) << ticked.log;
  EXPECT_EQ(fixture.library_calls(), 1u);
  EXPECT_EQ(to_string(fixture.result_of(1)), "success");

  auto foreign = submit(build("tick --chain-id elsewhere"));
  EXPECT_NE(foreign.code, 0u);
}
