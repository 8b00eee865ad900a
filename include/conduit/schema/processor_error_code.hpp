#pragma once

#include <cstdint>
#include <string_view>

namespace conduit::schema {

inline constexpr auto kProcessorCodespace =
    std::string_view{"conduit.processor"};

enum class processor_error_code : uint32_t {
  invalid_message = 1,
  unauthorized = 2,
  processor_paused = 10,
  queue_position_out_of_range = 11,
  batch_in_progress = 12,
  unknown_reply_id = 13,
  batch_not_found = 14,
  pending_confirmation_not_found = 15,
  invalid_confirmation_sender = 16,
  pending_callback_not_found = 17,
  callback_not_retriable = 18,
  not_polytone_domain = 19,
  proxy_creation_not_retriable = 20,
};

}  // namespace conduit::schema
