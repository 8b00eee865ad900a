#pragma once

#include <cstdint>
#include <string_view>

namespace conduit::schema {

inline constexpr auto kAuthorizationCodespace =
    std::string_view{"conduit.authorization"};

enum class authorization_error_code : uint32_t {
  invalid_message = 1,
  unauthorized = 2,
  empty_label = 10,
  label_already_exists = 11,
  no_functions = 12,
  different_function_domains = 13,
  domain_not_registered = 14,
  domain_already_exists = 15,
  permissionless_with_high_priority = 16,
  atomic_with_callback_confirmation = 17,
  unsupported_message_type = 18,
  invalid_max_concurrent_executions = 19,
  authorization_not_found = 20,
  authorization_disabled = 21,
  authorization_not_active_yet = 22,
  authorization_expired = 23,
  not_allowed = 24,
  concurrency_limit_reached = 25,
  cannot_mint_permissionless = 26,
  invalid_message_amount = 30,
  invalid_message_type = 31,
  invalid_json = 32,
  invalid_message_structure = 33,
  message_does_not_match = 34,
  invalid_message_params = 35,
  callback_not_found = 40,
  unauthorized_callback_sender = 41,
  retry_not_allowed = 42,
  invalid_callback_body = 43,
};

}  // namespace conduit::schema
