#pragma once

#include <conduit/schema/cosmos_msg.hpp>
#include <conduit/schema/primitives.hpp>
#include <conduit/schema/query_result.hpp>
#include <conduit/schema/transaction_result.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace conduit::host {

/// Environment a contract invocation observes.
struct env final {
  conduit::schema::block_info_t block;
  conduit::schema::address_t contract_address;
};

struct message_info final {
  conduit::schema::address_t sender;
};

enum class reply_on_t : uint8_t { never = 0, success = 1, error = 2, always = 3 };

/// Message a contract hands back to the host for dispatch. Sub-messages run
/// in their own state branch; with a matching reply_on the caller is told the
/// outcome through reply(), otherwise a failure aborts the caller as well.
struct sub_msg final {
  uint64_t id{};
  conduit::schema::cosmos_msg_t msg;
  reply_on_t reply_on{reply_on_t::never};
};

struct reply final {
  uint64_t id{};
  /// Set when the sub-message failed; its writes were discarded.
  std::optional<std::string> error;
  conduit::schema::bytes_t data;

  bool ok() const { return !error.has_value(); }
};

/// Result of one contract entry point. A non-zero code aborts the invocation
/// and discards its writes.
struct response final {
  uint32_t code{};
  std::string codespace;
  std::string log;
  conduit::schema::bytes_t data;
  std::vector<sub_msg> messages;
  std::vector<conduit::schema::event_attribute_t> attributes;

  bool ok() const { return code == 0; }

  response& add_message(conduit::schema::cosmos_msg_t msg);
  response& add_submessage(sub_msg msg);
  response& add_attribute(std::string key, std::string value);
};

template <typename Code>
response make_error(const Code code,
                    const std::string_view codespace,
                    std::string log) {
  static_assert(std::is_enum_v<Code>);
  return response{.code = static_cast<uint32_t>(code),
                  .codespace = std::string{codespace},
                  .log = std::move(log)};
}

conduit::schema::query_result_t make_query_error(
    conduit::schema::query_error_code code,
    std::string log,
    std::string_view codespace);

conduit::schema::query_result_t make_query_value(
    conduit::schema::bytes_t key,
    conduit::schema::bytes_t value);

}  // namespace conduit::host
