#include <conduit/common/critical.hpp>
#include <conduit/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>
#include <utility>

namespace conduit::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};
constexpr auto kBase64Alphabet = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

std::optional<uint8_t> digit_value(const std::string_view alphabet,
                                   const char ch) {
  auto position = alphabet.find(ch);
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(position);
}

std::optional<uint8_t> hex_value(const char ch) {
  return digit_value(
      kHexDigits,
      static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& text) {
  return bytes_t{std::begin(text), std::end(text)};
}

bytes_view_t make_bytes_view(const std::string_view& text) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(text.data()),
                      text.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{make_string_view(bytes)};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    out.push_back(kHexDigits[byte >> 4u]);
    out.push_back(kHexDigits[byte & 0x0Fu]);
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (auto it = std::begin(hex); it != std::end(hex); it += 2) {
    auto high = hex_value(*it);
    auto low = hex_value(*(it + 1));
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded) {
    conduit::common::critical("invalid hex input");
  }
  return std::move(*decoded);
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);
  for (std::size_t offset = 0; offset < bytes.size(); offset += 3) {
    auto available = std::min<std::size_t>(3, bytes.size() - offset);
    auto group = uint32_t{0};
    for (std::size_t i = 0; i < 3; ++i) {
      group <<= 8u;
      if (i < available) {
        group |= bytes[offset + i];
      }
    }
    // n input bytes produce n + 1 significant sextets.
    for (std::size_t i = 0; i < 4; ++i) {
      if (i <= available) {
        out.push_back(kBase64Alphabet[(group >> (18u - (6u * i))) & 0x3Fu]);
      } else {
        out.push_back('=');
      }
    }
  }
  return out;
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  std::ranges::copy_if(encoded, std::back_inserter(compact), [](char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) == 0;
  });
  if ((compact.size() % 4) != 0) {
    return std::nullopt;
  }

  auto out = bytes_t{};
  out.reserve((compact.size() / 4) * 3);
  for (std::size_t offset = 0; offset < compact.size(); offset += 4) {
    auto final_group = (offset + 4) == compact.size();
    auto group = uint32_t{0};
    auto padding = std::size_t{0};
    for (std::size_t i = 0; i < 4; ++i) {
      auto ch = compact[offset + i];
      group <<= 6u;
      if (ch == '=') {
        // Only the last two characters of the final group may pad.
        if (!final_group || i < 2) {
          return std::nullopt;
        }
        ++padding;
        continue;
      }
      auto sextet = digit_value(kBase64Alphabet, ch);
      if (!sextet || padding > 0) {
        return std::nullopt;
      }
      group |= *sextet;
    }
    for (std::size_t i = 0; i < 3 - padding; ++i) {
      out.push_back(static_cast<uint8_t>((group >> (16u - (8u * i))) & 0xFFu));
    }
  }
  return out;
}

bytes_t from_base64(const std::string_view encoded) {
  auto decoded = try_from_base64(encoded);
  if (!decoded) {
    conduit::common::critical("invalid base64 input");
  }
  return std::move(*decoded);
}

}  // namespace conduit::schema
