#pragma once

#include <conduit/schema/primitives.hpp>
#include <cstdint>
#include <variant>

// Schema type: host message.
// A call one contract asks the host to dispatch on its behalf.
namespace conduit::schema {

template <uint16_t Version>
struct wasm_execute;

template <>
struct wasm_execute<1> final {
  uint16_t version{1};
  address_t contract_address;
  bytes_t msg;
};

template <uint16_t Version>
struct wasm_migrate;

template <>
struct wasm_migrate<1> final {
  uint16_t version{1};
  address_t contract_address;
  uint64_t code_id{};
  bytes_t msg;
};

using wasm_execute_t = wasm_execute<1>;
using wasm_migrate_t = wasm_migrate<1>;
using cosmos_msg_t = std::variant<wasm_execute_t, wasm_migrate_t>;

inline const address_t& target_of(const cosmos_msg_t& msg) {
  return std::visit(
      [](const auto& value) -> const address_t& {
        return value.contract_address;
      },
      msg);
}

}  // namespace conduit::schema
