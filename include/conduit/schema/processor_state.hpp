#pragma once

#include <conduit/schema/enum_string.hpp>
#include <conduit/schema/execution_result.hpp>
#include <conduit/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: processor bookkeeping.
// In-flight sub-calls, awaited library confirmations and callbacks still
// travelling over a bridge.
namespace conduit::schema {

enum class operation_kind_t : uint8_t { atomic_batch = 0, non_atomic_function = 1 };

/// Continuation registered for a reply id.
template <uint16_t Version>
struct pending_operation;

template <>
struct pending_operation<1> final {
  uint16_t version{1};
  execution_id_t execution_id{};
  operation_kind_t kind{operation_kind_t::atomic_batch};
  uint64_t function_index{};
};

using pending_operation_t = pending_operation<1>;

/// Library confirmation a non-atomic function is waiting for.
template <uint16_t Version>
struct pending_confirmation;

template <>
struct pending_confirmation<1> final {
  uint16_t version{1};
  execution_id_t execution_id{};
  address_t address;
  bytes_t callback_msg;
  uint64_t function_index{};
};

using pending_confirmation_t = pending_confirmation<1>;

enum class bridge_delivery_t : uint8_t {
  none = 0,
  pending = 1,
  delivered = 2,
  timed_out = 3,
  unexpected_error = 4
};

inline constexpr auto kBridgeDeliveryMappings = std::array{
    enum_mapping_t<bridge_delivery_t>{"none", bridge_delivery_t::none},
    enum_mapping_t<bridge_delivery_t>{"pending", bridge_delivery_t::pending},
    enum_mapping_t<bridge_delivery_t>{"delivered",
                                      bridge_delivery_t::delivered},
    enum_mapping_t<bridge_delivery_t>{"timed_out",
                                      bridge_delivery_t::timed_out},
    enum_mapping_t<bridge_delivery_t>{"unexpected_error",
                                      bridge_delivery_t::unexpected_error}};

inline constexpr std::string_view to_string(const bridge_delivery_t value) {
  return to_string(value, kBridgeDeliveryMappings).value_or("unknown");
}

/// Bridge leg of a message, tracked apart from the execution outcome.
template <uint16_t Version>
struct bridge_state;

template <>
struct bridge_state<1> final {
  uint16_t version{1};
  bridge_delivery_t delivery{bridge_delivery_t::none};
  std::string error;
};

using bridge_state_t = bridge_state<1>;

/// Outcome the processor still has to get across the bridge.
template <uint16_t Version>
struct pending_bridge_callback;

template <>
struct pending_bridge_callback<1> final {
  uint16_t version{1};
  execution_result_t execution_result;
  bridge_state_t bridge;
};

using pending_bridge_callback_t = pending_bridge_callback<1>;

}  // namespace conduit::schema
