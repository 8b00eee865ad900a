#pragma once

#include <conduit/schema/authorization.hpp>
#include <conduit/schema/hyperlane.hpp>
#include <conduit/schema/message_batch.hpp>
#include <conduit/schema/polytone.hpp>
#include <conduit/schema/processor_config.hpp>
#include <conduit/schema/processor_message.hpp>
#include <conduit/schema/subroutine.hpp>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

// Schema type: processor messages.
namespace conduit::schema {

template <uint16_t Version>
struct processor_instantiate;

template <>
struct processor_instantiate<1> final {
  uint16_t version{1};
  address_t owner;
  address_t authorization_contract;
  processor_domain_t processor_domain;
};

using processor_instantiate_t = processor_instantiate<1>;

template <uint16_t Version>
struct update_config;

template <>
struct update_config<1> final {
  uint16_t version{1};
  std::optional<address_t> authorization_contract;
  std::optional<processor_domain_t> processor_domain;
};

using update_config_t = update_config<1>;

// Authorization module actions.

template <uint16_t Version>
struct enqueue_msgs;

template <>
struct enqueue_msgs<1> final {
  uint16_t version{1};
  execution_id_t execution_id{};
  std::vector<processor_message_t> msgs;
  subroutine_t subroutine;
  priority_t priority{priority_t::medium};
  std::optional<timestamp_seconds_t> expiration_time;
};

template <uint16_t Version>
struct evict_msgs;

template <>
struct evict_msgs<1> final {
  uint16_t version{1};
  uint64_t queue_position{};
  priority_t priority{priority_t::medium};
};

template <uint16_t Version>
struct insert_msgs;

template <>
struct insert_msgs<1> final {
  uint16_t version{1};
  execution_id_t execution_id{};
  uint64_t queue_position{};
  std::vector<processor_message_t> msgs;
  subroutine_t subroutine;
  priority_t priority{priority_t::medium};
  std::optional<timestamp_seconds_t> expiration_time;
};

template <uint16_t Version>
struct pause;

template <>
struct pause<1> final {
  uint16_t version{1};
};

template <uint16_t Version>
struct resume;

template <>
struct resume<1> final {
  uint16_t version{1};
};

using enqueue_msgs_t = enqueue_msgs<1>;
using evict_msgs_t = evict_msgs<1>;
using insert_msgs_t = insert_msgs<1>;
using pause_t = pause<1>;
using resume_t = resume<1>;
using authorization_module_msg_t =
    std::variant<enqueue_msgs_t, evict_msgs_t, insert_msgs_t, pause_t, resume_t>;

// Permissionless.

template <uint16_t Version>
struct tick;

template <>
struct tick<1> final {
  uint16_t version{1};
};

template <uint16_t Version>
struct retry_callback;

template <>
struct retry_callback<1> final {
  uint16_t version{1};
  execution_id_t execution_id{};
};

template <uint16_t Version>
struct retry_proxy_creation;

template <>
struct retry_proxy_creation<1> final {
  uint16_t version{1};
};

using tick_t = tick<1>;
using retry_callback_t = retry_callback<1>;
using retry_proxy_creation_t = retry_proxy_creation<1>;
using processor_permissionless_msg_t =
    std::variant<tick_t, retry_callback_t, retry_proxy_creation_t>;

// Internal.

/// Library confirmation for a function with callback confirmation.
template <uint16_t Version>
struct function_confirmation;

template <>
struct function_confirmation<1> final {
  uint16_t version{1};
  execution_id_t execution_id{};
  bytes_t msg;
};

/// Self call that runs a whole atomic batch inside one sub-message.
template <uint16_t Version>
struct execute_atomic;

template <>
struct execute_atomic<1> final {
  uint16_t version{1};
  message_batch_t batch;
};

using function_confirmation_t = function_confirmation<1>;
using execute_atomic_t = execute_atomic<1>;
using internal_processor_msg_t =
    std::variant<function_confirmation_t, execute_atomic_t>;

using processor_execute_msg_t = std::variant<update_config_t,
                                             authorization_module_msg_t,
                                             processor_permissionless_msg_t,
                                             internal_processor_msg_t,
                                             polytone_callback_message_t,
                                             hyperlane_handle_t>;

}  // namespace conduit::schema
