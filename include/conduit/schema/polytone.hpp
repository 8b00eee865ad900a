#pragma once

#include <conduit/schema/cosmos_msg.hpp>
#include <conduit/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Schema type: Polytone bridge messages.
// Note execute requests, the callback the note delivers back to the
// initiator, and the tags initiators attach to recognise those callbacks.
namespace conduit::schema {

inline constexpr auto kPolytoneTimeoutError = std::string_view{"timeout"};

template <uint16_t Version>
struct polytone_callback_request;

template <>
struct polytone_callback_request<1> final {
  uint16_t version{1};
  address_t receiver;
  bytes_t msg;
};

using polytone_callback_request_t = polytone_callback_request<1>;

/// Executed by the initiator's proxy on the remote chain. An empty `msgs`
/// only materializes the proxy.
template <uint16_t Version>
struct polytone_execute;

template <>
struct polytone_execute<1> final {
  uint16_t version{1};
  std::vector<cosmos_msg_t> msgs;
  std::optional<polytone_callback_request_t> callback;
  uint64_t timeout_seconds{};
};

using polytone_execute_t = polytone_execute<1>;

template <uint16_t Version>
struct polytone_execute_success;

template <>
struct polytone_execute_success<1> final {
  uint16_t version{1};
  std::vector<bytes_t> responses;
};

template <uint16_t Version>
struct polytone_execute_error;

template <>
struct polytone_execute_error<1> final {
  uint16_t version{1};
  std::string error;
};

using polytone_execute_success_t = polytone_execute_success<1>;
using polytone_execute_error_t = polytone_execute_error<1>;
using polytone_execute_result_t =
    std::variant<polytone_execute_success_t, polytone_execute_error_t>;

template <uint16_t Version>
struct polytone_callback_message;

template <>
struct polytone_callback_message<1> final {
  uint16_t version{1};
  address_t initiator;
  bytes_t initiator_msg;
  polytone_execute_result_t result;
};

using polytone_callback_message_t = polytone_callback_message<1>;

template <uint16_t Version>
struct polytone_tag_create_proxy;

template <>
struct polytone_tag_create_proxy<1> final {
  uint16_t version{1};
  std::string domain_name;
};

template <uint16_t Version>
struct polytone_tag_execution_id;

template <>
struct polytone_tag_execution_id<1> final {
  uint16_t version{1};
  execution_id_t execution_id{};
};

using polytone_tag_create_proxy_t = polytone_tag_create_proxy<1>;
using polytone_tag_execution_id_t = polytone_tag_execution_id<1>;
using polytone_callback_tag_t =
    std::variant<polytone_tag_create_proxy_t, polytone_tag_execution_id_t>;

}  // namespace conduit::schema
