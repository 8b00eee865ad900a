#pragma once

#include <conduit/schema/enum_string.hpp>
#include <conduit/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Schema type: message details.
// What a function accepts: the payload kind plus structural restrictions on
// its JSON body.
namespace conduit::schema {

enum class message_type_t : uint8_t {
  cosmwasm_execute_msg = 0,
  cosmwasm_migrate_msg = 1,
  evm_call = 2,
  evm_raw_call = 3
};

inline constexpr auto kMessageTypeMappings = std::array{
    enum_mapping_t<message_type_t>{"cosmwasm_execute_msg",
                                   message_type_t::cosmwasm_execute_msg},
    enum_mapping_t<message_type_t>{"cosmwasm_migrate_msg",
                                   message_type_t::cosmwasm_migrate_msg},
    enum_mapping_t<message_type_t>{"evm_call", message_type_t::evm_call},
    enum_mapping_t<message_type_t>{"evm_raw_call",
                                   message_type_t::evm_raw_call}};

template <>
inline std::optional<message_type_t> try_from_string<message_type_t>(
    const std::string_view value) {
  return from_string(value, kMessageTypeMappings);
}

inline constexpr std::string_view to_string(const message_type_t value) {
  return to_string(value, kMessageTypeMappings).value_or("unknown");
}

/// Path segments into the JSON body; the first segment is the method name.
using json_path_t = std::vector<std::string>;

template <uint16_t Version>
struct must_be_included;

template <>
struct must_be_included<1> final {
  uint16_t version{1};
  json_path_t path;
};

template <uint16_t Version>
struct cannot_be_included;

template <>
struct cannot_be_included<1> final {
  uint16_t version{1};
  json_path_t path;
};

/// `value` holds the serialized JSON the path must resolve to.
template <uint16_t Version>
struct must_be_value;

template <>
struct must_be_value<1> final {
  uint16_t version{1};
  json_path_t path;
  bytes_t value;
};

using must_be_included_t = must_be_included<1>;
using cannot_be_included_t = cannot_be_included<1>;
using must_be_value_t = must_be_value<1>;
using param_restriction_t =
    std::variant<must_be_included_t, cannot_be_included_t, must_be_value_t>;

template <uint16_t Version>
struct message_definition;

template <>
struct message_definition<1> final {
  uint16_t version{1};
  std::string name;
  std::optional<std::vector<param_restriction_t>> params_restrictions;
};

using message_definition_t = message_definition<1>;

template <uint16_t Version>
struct message_details;

template <>
struct message_details<1> final {
  uint16_t version{1};
  message_type_t message_type{message_type_t::cosmwasm_execute_msg};
  message_definition_t message;
};

using message_details_t = message_details<1>;

}  // namespace conduit::schema
