#pragma once

#include <conduit/schema/domain.hpp>
#include <conduit/schema/enum_string.hpp>
#include <conduit/schema/primitives.hpp>
#include <cstdint>
#include <variant>

// Schema type: processor configuration.
namespace conduit::schema {

enum class processor_state_t : uint8_t { active = 0, paused = 1 };

inline constexpr auto kProcessorStateMappings = std::array{
    enum_mapping_t<processor_state_t>{"active", processor_state_t::active},
    enum_mapping_t<processor_state_t>{"paused", processor_state_t::paused}};

inline constexpr std::string_view to_string(const processor_state_t value) {
  return to_string(value, kProcessorStateMappings).value_or("unknown");
}

template <uint16_t Version>
struct processor_domain_main;

template <>
struct processor_domain_main<1> final {
  uint16_t version{1};
};

/// Processor reached from the main domain through Polytone. Messages arrive
/// from the registry's proxy on this chain; callbacks leave through the note
/// via this processor's own proxy on the main domain.
template <uint16_t Version>
struct processor_domain_polytone;

template <>
struct processor_domain_polytone<1> final {
  uint16_t version{1};
  address_t polytone_proxy_address;
  address_t polytone_note_address;
  uint64_t timeout_seconds{};
  polytone_proxy_state_t proxy_on_main_domain_state;
};

/// Processor reached from the main domain through a Hyperlane mailbox.
template <uint16_t Version>
struct processor_domain_hyperlane;

template <>
struct processor_domain_hyperlane<1> final {
  uint16_t version{1};
  address_t mailbox;
  uint32_t main_domain_id{};
};

using processor_domain_main_t = processor_domain_main<1>;
using processor_domain_polytone_t = processor_domain_polytone<1>;
using processor_domain_hyperlane_t = processor_domain_hyperlane<1>;
using processor_domain_t = std::variant<processor_domain_main_t,
                                        processor_domain_polytone_t,
                                        processor_domain_hyperlane_t>;

template <uint16_t Version>
struct processor_config;

template <>
struct processor_config<1> final {
  uint16_t version{1};
  address_t authorization_contract;
  processor_domain_t processor_domain;
  processor_state_t state{processor_state_t::active};
};

using processor_config_t = processor_config<1>;

}  // namespace conduit::schema
