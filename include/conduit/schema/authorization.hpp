#pragma once

#include <conduit/schema/enum_string.hpp>
#include <conduit/schema/expiration.hpp>
#include <conduit/schema/primitives.hpp>
#include <conduit/schema/subroutine.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Schema type: authorization.
// Named, access controlled template for a subroutine on one domain.
namespace conduit::schema {

enum class priority_t : uint8_t { medium = 0, high = 1 };

inline constexpr auto kPriorityMappings =
    std::array{enum_mapping_t<priority_t>{"medium", priority_t::medium},
               enum_mapping_t<priority_t>{"high", priority_t::high}};

template <>
inline std::optional<priority_t> try_from_string<priority_t>(
    const std::string_view value) {
  return from_string(value, kPriorityMappings);
}

inline constexpr std::string_view to_string(const priority_t value) {
  return to_string(value, kPriorityMappings).value_or("unknown");
}

enum class authorization_state_t : uint8_t { enabled = 0, disabled = 1 };

inline constexpr auto kAuthorizationStateMappings = std::array{
    enum_mapping_t<authorization_state_t>{"enabled",
                                          authorization_state_t::enabled},
    enum_mapping_t<authorization_state_t>{"disabled",
                                          authorization_state_t::disabled}};

inline constexpr std::string_view to_string(
    const authorization_state_t value) {
  return to_string(value, kAuthorizationStateMappings).value_or("unknown");
}

template <uint16_t Version>
struct address_allowance;

template <>
struct address_allowance<1> final {
  uint16_t version{1};
  address_t address;
  amount_t amount{};
};

using address_allowance_t = address_allowance<1>;

/// Every call consumes one unit of the caller's allowance.
template <uint16_t Version>
struct permission_with_call_limit;

template <>
struct permission_with_call_limit<1> final {
  uint16_t version{1};
  std::vector<address_allowance_t> allowances;
};

/// Holders of a positive allowance may call without consuming it.
template <uint16_t Version>
struct permission_without_call_limit;

template <>
struct permission_without_call_limit<1> final {
  uint16_t version{1};
  std::vector<address_t> addresses;
};

using permission_with_call_limit_t = permission_with_call_limit<1>;
using permission_without_call_limit_t = permission_without_call_limit<1>;
using permission_type_t = std::variant<permission_with_call_limit_t,
                                       permission_without_call_limit_t>;

template <uint16_t Version>
struct mode_permissionless;

template <>
struct mode_permissionless<1> final {
  uint16_t version{1};
};

template <uint16_t Version>
struct mode_permissioned;

template <>
struct mode_permissioned<1> final {
  uint16_t version{1};
  permission_type_t permission;
};

using mode_permissionless_t = mode_permissionless<1>;
using mode_permissioned_t = mode_permissioned<1>;
using authorization_mode_t =
    std::variant<mode_permissionless_t, mode_permissioned_t>;

template <uint16_t Version>
struct lifetime_forever;

template <>
struct lifetime_forever<1> final {
  uint16_t version{1};
};

template <uint16_t Version>
struct lifetime_seconds;

template <>
struct lifetime_seconds<1> final {
  uint16_t version{1};
  uint64_t seconds{};
};

template <uint16_t Version>
struct lifetime_blocks;

template <>
struct lifetime_blocks<1> final {
  uint16_t version{1};
  uint64_t blocks{};
};

using lifetime_forever_t = lifetime_forever<1>;
using lifetime_seconds_t = lifetime_seconds<1>;
using lifetime_blocks_t = lifetime_blocks<1>;
/// How long an authorization stays valid after creation.
using authorization_duration_t =
    std::variant<lifetime_forever_t, lifetime_seconds_t, lifetime_blocks_t>;

/// Creation request. Optional fields fall back to the registry defaults.
template <uint16_t Version>
struct authorization_info;

template <>
struct authorization_info<1> final {
  uint16_t version{1};
  std::string label;
  authorization_mode_t mode;
  expiration_t not_before;
  authorization_duration_t duration;
  std::optional<uint64_t> max_concurrent_executions;
  subroutine_t subroutine;
  std::optional<priority_t> priority;
};

using authorization_info_t = authorization_info<1>;

inline constexpr uint64_t kDefaultMaxConcurrentExecutions = 1;

template <uint16_t Version>
struct authorization;

template <>
struct authorization<1> final {
  uint16_t version{1};
  std::string label;
  authorization_mode_t mode;
  expiration_t not_before;
  expiration_t expiration;
  uint64_t max_concurrent_executions{kDefaultMaxConcurrentExecutions};
  subroutine_t subroutine;
  priority_t priority{priority_t::medium};
  authorization_state_t state{authorization_state_t::enabled};
};

using authorization_t = authorization<1>;

/// Materialize a request against the block it is created in.
authorization_t make_authorization(const authorization_info_t& info,
                                   const block_info_t& block);

/// Domain every function of the subroutine must target.
const domain_t& target_domain(const authorization_t& authorization);

inline bool is_permissionless(const authorization_mode_t& mode) {
  return std::holds_alternative<mode_permissionless_t>(mode);
}

}  // namespace conduit::schema
