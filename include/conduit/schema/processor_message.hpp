#pragma once

#include <conduit/schema/message_details.hpp>
#include <conduit/schema/primitives.hpp>
#include <cstdint>
#include <variant>

// Schema type: processor message.
// Opaque library call carried inside a batch. The body is JSON for CosmWasm
// targets and pre-encoded calldata for EVM targets.
namespace conduit::schema {

template <uint16_t Version>
struct cosmwasm_execute_msg;

template <>
struct cosmwasm_execute_msg<1> final {
  uint16_t version{1};
  bytes_t msg;
  bool operator==(const cosmwasm_execute_msg&) const = default;
};

template <uint16_t Version>
struct cosmwasm_migrate_msg;

template <>
struct cosmwasm_migrate_msg<1> final {
  uint16_t version{1};
  uint64_t code_id{};
  bytes_t msg;
  bool operator==(const cosmwasm_migrate_msg&) const = default;
};

template <uint16_t Version>
struct evm_call_msg;

template <>
struct evm_call_msg<1> final {
  uint16_t version{1};
  bytes_t msg;
  bool operator==(const evm_call_msg&) const = default;
};

template <uint16_t Version>
struct evm_raw_call_msg;

template <>
struct evm_raw_call_msg<1> final {
  uint16_t version{1};
  bytes_t msg;
  bool operator==(const evm_raw_call_msg&) const = default;
};

using cosmwasm_execute_msg_t = cosmwasm_execute_msg<1>;
using cosmwasm_migrate_msg_t = cosmwasm_migrate_msg<1>;
using evm_call_msg_t = evm_call_msg<1>;
using evm_raw_call_msg_t = evm_raw_call_msg<1>;
using processor_message_t = std::variant<cosmwasm_execute_msg_t,
                                         cosmwasm_migrate_msg_t,
                                         evm_call_msg_t,
                                         evm_raw_call_msg_t>;

message_type_t message_type_of(const processor_message_t& message);

const bytes_t& payload_of(const processor_message_t& message);

/// Same message with its body replaced.
processor_message_t with_payload(const processor_message_t& message,
                                 bytes_t payload);

}  // namespace conduit::schema
