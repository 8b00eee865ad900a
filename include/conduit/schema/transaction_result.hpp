#pragma once

#include <conduit/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Outcome of a committed or rejected transaction. Events are kept only when
// the transaction commits; each one is tagged with the contract that emitted
// it.
namespace conduit::schema {

template <uint16_t Version>
struct event_attribute;

template <>
struct event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
};

using event_attribute_t = event_attribute<1>;

template <uint16_t Version>
struct contract_event;

template <>
struct contract_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<event_attribute_t> attributes;

  std::optional<std::string> attribute(const std::string_view key) const {
    for (const auto& entry : attributes) {
      if (entry.key == key) {
        return entry.value;
      }
    }
    return std::nullopt;
  }
};

using contract_event_t = contract_event<1>;

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string codespace;
  std::vector<contract_event_t> events;

  bool ok() const { return code == 0; }
};

using transaction_result_t = transaction_result<1>;

}  // namespace conduit::schema
