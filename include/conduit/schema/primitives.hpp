#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace conduit::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::string;
using amount_t = boost::multiprecision::uint128_t;
using execution_id_t = uint64_t;
using block_height_t = uint64_t;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;

// Byte and text views over the same storage. Strings convert through
// std::string_view.
bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& text);
bytes_view_t make_bytes_view(const std::string_view& text);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_view_t& bytes);

// Lowercase hex out; an optional 0x prefix is accepted in.
std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(const std::string_view hex);

// Standard padded alphabet. Whitespace is ignored when decoding.
std::string to_base64(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base64(const std::string_view encoded);
bytes_t from_base64(const std::string_view encoded);

/// Chain clock as seen by a contract invocation.
struct block_info final {
  block_height_t height{};
  timestamp_seconds_t time{};
  std::string chain_id;
};

using block_info_t = block_info;

}  // namespace conduit::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
