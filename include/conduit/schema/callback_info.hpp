#pragma once

#include <conduit/schema/domain.hpp>
#include <conduit/schema/execution_result.hpp>
#include <conduit/schema/expiration.hpp>
#include <conduit/schema/processor_message.hpp>
#include <conduit/schema/processor_state.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: processor callback info.
// Registry side record of one execution id, from send to settlement.
namespace conduit::schema {

template <uint16_t Version>
struct processor_callback_info;

template <>
struct processor_callback_info<1> final {
  uint16_t version{1};
  execution_id_t execution_id{};
  std::string label;
  address_t initiator;
  domain_t domain;
  /// Only this sender may report the result.
  address_t processor_callback_address;
  std::vector<processor_message_t> messages;
  std::optional<expiration_t> ttl;
  execution_result_t execution_result;
  bridge_state_t bridge;
  /// Routed processor payload, kept so a timed out delivery can be resent.
  bytes_t dispatch_payload;
  bool escrowed_mint{};
  bool holds_concurrency_slot{};
  block_height_t created_at_height{};
  timestamp_seconds_t created_at_time{};
};

using processor_callback_info_t = processor_callback_info<1>;

}  // namespace conduit::schema
