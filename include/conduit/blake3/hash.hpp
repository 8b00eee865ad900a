#pragma once
#include <conduit/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace conduit::blake3 {

conduit::schema::hash32_t hash(const std::string_view& str);
conduit::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

/// Hash of previous || bytes; used to chain digests.
conduit::schema::hash32_t fold(const conduit::schema::hash32_t& previous,
                               const std::span<const uint8_t>& bytes);

}  // namespace conduit::blake3
