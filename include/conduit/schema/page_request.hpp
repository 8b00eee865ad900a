#pragma once

#include <conduit/schema/authorization.hpp>
#include <conduit/schema/primitives.hpp>
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: paginated query requests.
namespace conduit::schema {

inline constexpr uint32_t kMaxPageLimit = 250;

template <uint16_t Version>
struct page_request;

template <>
struct page_request<1> final {
  uint16_t version{1};
  std::optional<std::string> start_after;
  std::optional<uint32_t> limit;
};

template <uint16_t Version>
struct id_page_request;

template <>
struct id_page_request<1> final {
  uint16_t version{1};
  std::optional<execution_id_t> start_after;
  std::optional<uint32_t> limit;
};

template <uint16_t Version>
struct mint_balance_request;

template <>
struct mint_balance_request<1> final {
  uint16_t version{1};
  std::string label;
  address_t address;
};

/// Lane slice of a processor queue, [from, to).
template <uint16_t Version>
struct queue_request;

template <>
struct queue_request<1> final {
  uint16_t version{1};
  priority_t priority{priority_t::medium};
  std::optional<uint64_t> from;
  std::optional<uint64_t> to;
};

using page_request_t = page_request<1>;
using id_page_request_t = id_page_request<1>;
using mint_balance_request_t = mint_balance_request<1>;
using queue_request_t = queue_request<1>;

inline std::size_t page_limit(const std::optional<uint32_t>& limit) {
  return limit ? std::min<std::size_t>(*limit, kMaxPageLimit) : kMaxPageLimit;
}

}  // namespace conduit::schema
