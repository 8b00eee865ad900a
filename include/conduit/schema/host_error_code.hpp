#pragma once

#include <cstdint>
#include <string_view>

namespace conduit::schema {

inline constexpr auto kHostCodespace = std::string_view{"conduit.host"};

enum class host_error_code : uint32_t {
  invalid_transaction = 1,
  contract_not_found = 2,
  contract_already_registered = 3,
  unsupported_entry_point = 4,
  dispatch_depth_exceeded = 5,
  unauthorized_migration = 6,
  already_instantiated = 7,
};

}  // namespace conduit::schema
