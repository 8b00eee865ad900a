#pragma once

#include <cstdint>
#include <string_view>

namespace conduit::schema {

inline constexpr auto kBridgeCodespace = std::string_view{"conduit.bridge"};

enum class bridge_error_code : uint32_t {
  relay_timeout = 1,
  proxy_not_created = 2,
  unexpected_relay_failure = 3,
  unknown_bridge_sender = 4,
  invalid_initiator = 5,
  unsupported_environment = 6,
};

}  // namespace conduit::schema
