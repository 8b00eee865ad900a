#pragma once

#include <conduit/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <variant>

// Schema type: expiration and duration.
// Absolute deadlines (block height or block time) and the relative durations
// they are computed from.
namespace conduit::schema {

template <uint16_t Version>
struct expiration_never;

template <>
struct expiration_never<1> final {
  uint16_t version{1};
  bool operator==(const expiration_never&) const = default;
};

template <uint16_t Version>
struct expiration_at_height;

template <>
struct expiration_at_height<1> final {
  uint16_t version{1};
  block_height_t height{};
  bool operator==(const expiration_at_height&) const = default;
};

template <uint16_t Version>
struct expiration_at_time;

template <>
struct expiration_at_time<1> final {
  uint16_t version{1};
  timestamp_seconds_t time{};
  bool operator==(const expiration_at_time&) const = default;
};

using expiration_never_t = expiration_never<1>;
using expiration_at_height_t = expiration_at_height<1>;
using expiration_at_time_t = expiration_at_time<1>;
using expiration_t = std::variant<expiration_never_t,
                                  expiration_at_height_t,
                                  expiration_at_time_t>;

template <uint16_t Version>
struct duration_height;

template <>
struct duration_height<1> final {
  uint16_t version{1};
  uint64_t blocks{};
  bool operator==(const duration_height&) const = default;
};

template <uint16_t Version>
struct duration_time;

template <>
struct duration_time<1> final {
  uint16_t version{1};
  duration_seconds_t seconds{};
  bool operator==(const duration_time&) const = default;
};

using duration_height_t = duration_height<1>;
using duration_time_t = duration_time<1>;
using duration_t = std::variant<duration_height_t, duration_time_t>;

/// True once the block reached the deadline. Never never expires.
bool is_expired(const expiration_t& expiration, const block_info_t& block);

/// Deadline reached `duration` after the given block.
expiration_t expires_after(const duration_t& duration,
                           const block_info_t& block);

std::string to_string(const expiration_t& expiration);

}  // namespace conduit::schema
