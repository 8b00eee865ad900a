#pragma once

#include <conduit/schema/authorization.hpp>
#include <conduit/schema/expiration.hpp>
#include <conduit/schema/processor_message.hpp>
#include <conduit/schema/subroutine.hpp>
#include <cstdint>
#include <optional>
#include <vector>

// Schema type: message batch.
// One queued instance of a subroutine, identified by its execution id.
namespace conduit::schema {

template <uint16_t Version>
struct message_batch;

template <>
struct message_batch<1> final {
  uint16_t version{1};
  execution_id_t execution_id{};
  std::vector<processor_message_t> msgs;
  subroutine_t subroutine;
  priority_t priority{priority_t::medium};
  std::optional<timestamp_seconds_t> expiration_time;
};

using message_batch_t = message_batch<1>;

/// Present only while a batch is waiting out a retry cooldown.
template <uint16_t Version>
struct current_retry;

template <>
struct current_retry<1> final {
  uint16_t version{1};
  uint64_t retry_amounts{};
  expiration_t retry_cooldown;
};

using current_retry_t = current_retry<1>;

}  // namespace conduit::schema
