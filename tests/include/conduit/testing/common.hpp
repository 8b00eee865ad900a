#pragma once

#include <conduit/schema/encoding/scale/encoder.hpp>
#include <conduit/schema/primitives.hpp>
#include <conduit/schema/query_result.hpp>
#include <conduit/schema/transaction_result.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace conduit::testing {

using encoder_t = conduit::schema::encoding::scale_encoder_t;

inline constexpr auto kOwner = std::string_view{"owner"};
inline constexpr auto kSubOwner = std::string_view{"sub_owner"};
inline constexpr auto kUser = std::string_view{"user"};
inline constexpr auto kStranger = std::string_view{"stranger"};
inline constexpr auto kRegistry = std::string_view{"registry"};
inline constexpr auto kProcessor = std::string_view{"processor"};
inline constexpr auto kGenesisTime = uint64_t{1'700'000'000};

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

template <typename T>
conduit::schema::bytes_t encode(const T& value) {
  auto encoder = encoder_t{};
  return encoder.encode(value);
}

template <typename T>
T decode(const conduit::schema::bytes_t& bytes) {
  auto encoder = encoder_t{};
  return encoder.decode<T>(conduit::schema::bytes_view_t{bytes});
}

template <typename T>
T decode_value(const conduit::schema::query_result_t& result) {
  return decode<T>(result.value);
}

inline conduit::schema::bytes_t json(const std::string_view text) {
  return conduit::schema::make_bytes(text);
}

/// Value of `key` in the first event emitted by `contract`.
inline std::optional<std::string> event_attribute(
    const conduit::schema::transaction_result_t& result,
    const std::string_view contract,
    const std::string_view key) {
  for (const auto& event : result.events) {
    if (event.attribute("_contract_address") != std::string{contract}) {
      continue;
    }
    if (auto value = event.attribute(key)) {
      return value;
    }
  }
  return std::nullopt;
}

}  // namespace conduit::testing
