#pragma once

#include <cstdint>
#include <string>
#include <variant>

// Schema type: execution result.
// Outcome of one execution id as reported back to the registry.
namespace conduit::schema {

template <uint16_t Version>
struct result_in_process;

template <>
struct result_in_process<1> final {
  uint16_t version{1};
  bool operator==(const result_in_process&) const = default;
};

template <uint16_t Version>
struct result_success;

template <>
struct result_success<1> final {
  uint16_t version{1};
  bool operator==(const result_success&) const = default;
};

template <uint16_t Version>
struct result_rejected;

template <>
struct result_rejected<1> final {
  uint16_t version{1};
  std::string error;
  bool operator==(const result_rejected&) const = default;
};

/// `executed_count` functions completed before `error` stopped the batch.
template <uint16_t Version>
struct result_partially_executed;

template <>
struct result_partially_executed<1> final {
  uint16_t version{1};
  uint64_t executed_count{};
  std::string error;
  bool operator==(const result_partially_executed&) const = default;
};

template <uint16_t Version>
struct result_removed_by_owner;

template <>
struct result_removed_by_owner<1> final {
  uint16_t version{1};
  bool operator==(const result_removed_by_owner&) const = default;
};

/// Bridge delivery timed out. Retriable while the send ttl holds.
template <uint16_t Version>
struct result_timeout;

template <>
struct result_timeout<1> final {
  uint16_t version{1};
  bool retriable{};
  bool operator==(const result_timeout&) const = default;
};

template <uint16_t Version>
struct result_expired;

template <>
struct result_expired<1> final {
  uint16_t version{1};
  uint64_t executed_count{};
  bool operator==(const result_expired&) const = default;
};

template <uint16_t Version>
struct result_unexpected_error;

template <>
struct result_unexpected_error<1> final {
  uint16_t version{1};
  std::string error;
  bool operator==(const result_unexpected_error&) const = default;
};

using result_in_process_t = result_in_process<1>;
using result_success_t = result_success<1>;
using result_rejected_t = result_rejected<1>;
using result_partially_executed_t = result_partially_executed<1>;
using result_removed_by_owner_t = result_removed_by_owner<1>;
using result_timeout_t = result_timeout<1>;
using result_expired_t = result_expired<1>;
using result_unexpected_error_t = result_unexpected_error<1>;

using execution_result_t = std::variant<result_in_process_t,
                                        result_success_t,
                                        result_rejected_t,
                                        result_partially_executed_t,
                                        result_removed_by_owner_t,
                                        result_timeout_t,
                                        result_expired_t,
                                        result_unexpected_error_t>;

/// Final outcomes; InProcess and a retriable Timeout may still change.
bool is_terminal(const execution_result_t& result);

/// True when no function of the batch took effect.
bool is_nothing_executed(const execution_result_t& result);

std::string to_string(const execution_result_t& result);

}  // namespace conduit::schema
