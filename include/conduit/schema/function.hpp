#pragma once

#include <conduit/schema/domain.hpp>
#include <conduit/schema/expiration.hpp>
#include <conduit/schema/message_details.hpp>
#include <conduit/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <variant>

// Schema type: functions and their retry policies.
namespace conduit::schema {

template <uint16_t Version>
struct retry_indefinitely;

template <>
struct retry_indefinitely<1> final {
  uint16_t version{1};
};

template <uint16_t Version>
struct retry_amount;

template <>
struct retry_amount<1> final {
  uint16_t version{1};
  uint64_t amount{};
};

using retry_indefinitely_t = retry_indefinitely<1>;
using retry_amount_t = retry_amount<1>;
using retry_times_t = std::variant<retry_indefinitely_t, retry_amount_t>;

/// Absent retry logic means a single attempt.
template <uint16_t Version>
struct retry_logic;

template <>
struct retry_logic<1> final {
  uint16_t version{1};
  retry_times_t times;
  duration_t interval;
};

using retry_logic_t = retry_logic<1>;

/// Confirmation a library sends back after finishing asynchronously.
template <uint16_t Version>
struct function_callback;

template <>
struct function_callback<1> final {
  uint16_t version{1};
  address_t contract_address;
  bytes_t callback_message;
};

using function_callback_t = function_callback<1>;

template <uint16_t Version>
struct atomic_function;

template <>
struct atomic_function<1> final {
  uint16_t version{1};
  domain_t domain;
  message_details_t message_details;
  address_t contract_address;
};

template <uint16_t Version>
struct non_atomic_function;

template <>
struct non_atomic_function<1> final {
  uint16_t version{1};
  domain_t domain;
  message_details_t message_details;
  address_t contract_address;
  std::optional<retry_logic_t> retry_logic;
  std::optional<function_callback_t> callback_confirmation;
};

using atomic_function_t = atomic_function<1>;
using non_atomic_function_t = non_atomic_function<1>;

}  // namespace conduit::schema
