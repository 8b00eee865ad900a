#pragma once

#include <conduit/schema/enum_string.hpp>
#include <conduit/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

// Schema type: domains and the bridges that reach them.
namespace conduit::schema {

template <uint16_t Version>
struct domain_main;

template <>
struct domain_main<1> final {
  uint16_t version{1};
  bool operator==(const domain_main&) const = default;
};

template <uint16_t Version>
struct domain_external;

template <>
struct domain_external<1> final {
  uint16_t version{1};
  std::string name;
  bool operator==(const domain_external&) const = default;
};

using domain_main_t = domain_main<1>;
using domain_external_t = domain_external<1>;
using domain_t = std::variant<domain_main_t, domain_external_t>;

std::string to_string(const domain_t& domain);

enum class polytone_proxy_status_t : uint8_t {
  pending_response = 0,
  created = 1,
  timed_out = 2,
  unexpected_error = 3
};

inline constexpr auto kPolytoneProxyStatusMappings = std::array{
    enum_mapping_t<polytone_proxy_status_t>{
        "pending_response", polytone_proxy_status_t::pending_response},
    enum_mapping_t<polytone_proxy_status_t>{"created",
                                            polytone_proxy_status_t::created},
    enum_mapping_t<polytone_proxy_status_t>{
        "timed_out", polytone_proxy_status_t::timed_out},
    enum_mapping_t<polytone_proxy_status_t>{
        "unexpected_error", polytone_proxy_status_t::unexpected_error}};

inline constexpr std::string_view to_string(
    const polytone_proxy_status_t value) {
  return to_string(value, kPolytoneProxyStatusMappings).value_or("unknown");
}

/// Lifecycle of a lazily created remote proxy account.
template <uint16_t Version>
struct polytone_proxy_state;

template <>
struct polytone_proxy_state<1> final {
  uint16_t version{1};
  polytone_proxy_status_t status{polytone_proxy_status_t::pending_response};
  std::string error;
  bool operator==(const polytone_proxy_state&) const = default;
};

using polytone_proxy_state_t = polytone_proxy_state<1>;

template <uint16_t Version>
struct polytone_note;

template <>
struct polytone_note<1> final {
  uint16_t version{1};
  address_t address;
  uint64_t timeout_seconds{};
  polytone_proxy_state_t state;
};

using polytone_note_t = polytone_note<1>;

/// Polytone connection of an external CosmWasm domain. `proxy` is the
/// processor's proxy on the main domain, the only sender allowed to deliver
/// that processor's callbacks.
template <uint16_t Version>
struct polytone_connectors;

template <>
struct polytone_connectors<1> final {
  uint16_t version{1};
  polytone_note_t note;
  address_t proxy;
};

using polytone_connectors_t = polytone_connectors<1>;

template <uint16_t Version>
struct evm_encoder;

template <>
struct evm_encoder<1> final {
  uint16_t version{1};
  address_t broker_address;
  std::string encoder_version;
};

using evm_encoder_t = evm_encoder<1>;

template <uint16_t Version>
struct hyperlane_connector;

template <>
struct hyperlane_connector<1> final {
  uint16_t version{1};
  address_t mailbox;
  uint32_t domain_id{};
};

using hyperlane_connector_t = hyperlane_connector<1>;

template <uint16_t Version>
struct cosmwasm_environment;

template <>
struct cosmwasm_environment<1> final {
  uint16_t version{1};
  polytone_connectors_t polytone;
};

template <uint16_t Version>
struct evm_environment;

template <>
struct evm_environment<1> final {
  uint16_t version{1};
  evm_encoder_t encoder;
  hyperlane_connector_t hyperlane;
};

using cosmwasm_environment_t = cosmwasm_environment<1>;
using evm_environment_t = evm_environment<1>;
using execution_environment_t =
    std::variant<cosmwasm_environment_t, evm_environment_t>;

template <uint16_t Version>
struct external_domain;

template <>
struct external_domain<1> final {
  uint16_t version{1};
  std::string name;
  execution_environment_t execution_environment;
  address_t processor;
};

using external_domain_t = external_domain<1>;

/// Registration request; proxy state is owned by the registry.
template <uint16_t Version>
struct polytone_note_info;

template <>
struct polytone_note_info<1> final {
  uint16_t version{1};
  address_t address;
  uint64_t timeout_seconds{};
};

using polytone_note_info_t = polytone_note_info<1>;

template <uint16_t Version>
struct polytone_connectors_info;

template <>
struct polytone_connectors_info<1> final {
  uint16_t version{1};
  polytone_note_info_t note;
  address_t proxy;
};

using polytone_connectors_info_t = polytone_connectors_info<1>;

using execution_environment_info_t =
    std::variant<polytone_connectors_info_t, evm_environment_t>;

template <uint16_t Version>
struct external_domain_info;

template <>
struct external_domain_info<1> final {
  uint16_t version{1};
  std::string name;
  execution_environment_info_t execution_environment;
  address_t processor;
};

using external_domain_info_t = external_domain_info<1>;

/// Polytone connectors of a domain, or nullptr for EVM domains.
const polytone_connectors_t* polytone_of(const external_domain_t& domain);
polytone_connectors_t* polytone_of(external_domain_t& domain);

/// Hyperlane connector of a domain, or nullptr for CosmWasm domains.
const hyperlane_connector_t* hyperlane_of(const external_domain_t& domain);

}  // namespace conduit::schema
