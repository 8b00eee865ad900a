#pragma once

#include <conduit/schema/function.hpp>
#include <cstddef>
#include <optional>
#include <variant>
#include <vector>

// Schema type: subroutine.
// Ordered functions executed either all-or-nothing (atomic) or one by one
// with per-function retries (non-atomic). `expiration_time` is relative and
// turns into an absolute batch deadline when the batch is sent.
namespace conduit::schema {

template <uint16_t Version>
struct atomic_subroutine;

template <>
struct atomic_subroutine<1> final {
  uint16_t version{1};
  std::vector<atomic_function_t> functions;
  std::optional<retry_logic_t> retry_logic;
  std::optional<duration_seconds_t> expiration_time;
};

template <uint16_t Version>
struct non_atomic_subroutine;

template <>
struct non_atomic_subroutine<1> final {
  uint16_t version{1};
  std::vector<non_atomic_function_t> functions;
  std::optional<duration_seconds_t> expiration_time;
};

using atomic_subroutine_t = atomic_subroutine<1>;
using non_atomic_subroutine_t = non_atomic_subroutine<1>;
using subroutine_t = std::variant<atomic_subroutine_t, non_atomic_subroutine_t>;

inline bool is_atomic(const subroutine_t& subroutine) {
  return std::holds_alternative<atomic_subroutine_t>(subroutine);
}

std::size_t function_count(const subroutine_t& subroutine);

/// Accessors for function `index`; index must be below function_count().
const domain_t& function_domain(const subroutine_t& subroutine,
                                std::size_t index);
const address_t& function_contract(const subroutine_t& subroutine,
                                   std::size_t index);
const message_details_t& function_message_details(
    const subroutine_t& subroutine,
    std::size_t index);

/// Retry policy that governs a failure of function `index`.
std::optional<retry_logic_t> retry_logic_for(const subroutine_t& subroutine,
                                             std::size_t index);

std::optional<function_callback_t> callback_confirmation_for(
    const subroutine_t& subroutine,
    std::size_t index);

std::optional<duration_seconds_t> expiration_time_of(
    const subroutine_t& subroutine);

}  // namespace conduit::schema
