#pragma once
#include <conduit/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace conduit::schema::key {

struct builder final {
  conduit::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
      data.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
    return *this;
  }

  /// Big endian so that bytewise key order matches numeric order.
  template <typename T, typename = std::enable_if_t<std::is_unsigned_v<T>>>
  builder& write_ordered(T value) {
    for (size_t i = sizeof(T); i > 0; --i) {
      data.push_back(static_cast<uint8_t>((value >> ((i - 1) * 8)) & 0xFF));
    }
    return *this;
  }
};

/// Inverse of builder::write_ordered for a key suffix.
template <typename T, typename = std::enable_if_t<std::is_unsigned_v<T>>>
std::optional<T> read_ordered(const std::span<const uint8_t>& bytes) {
  if (bytes.size() != sizeof(T)) {
    return std::nullopt;
  }
  auto value = T{};
  for (const auto byte : bytes) {
    value = static_cast<T>((value << 8) | byte);
  }
  return value;
}

}  // namespace conduit::schema::key
