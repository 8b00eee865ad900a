#pragma once

#include <conduit/schema/primitives.hpp>
#include <cstdint>

// Schema type: Hyperlane mailbox messages.
namespace conduit::schema {

/// Sent to the local mailbox to reach `recipient` on `destination_domain`.
template <uint16_t Version>
struct hyperlane_dispatch;

template <>
struct hyperlane_dispatch<1> final {
  uint16_t version{1};
  uint32_t destination_domain{};
  address_t recipient;
  bytes_t body;
};

/// Delivered by the local mailbox to the recipient.
template <uint16_t Version>
struct hyperlane_handle;

template <>
struct hyperlane_handle<1> final {
  uint16_t version{1};
  uint32_t origin{};
  address_t sender;
  bytes_t body;
};

using hyperlane_dispatch_t = hyperlane_dispatch<1>;
using hyperlane_handle_t = hyperlane_handle<1>;

}  // namespace conduit::schema
