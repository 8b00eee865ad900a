#pragma once

#include <conduit/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace conduit::schema {

enum class query_error_code : uint32_t {
  malformed_request = 1,
  not_found = 2,
  unknown_path = 3,
  no_contract = 4,
};

// Contract reads: the SCALE encoded value under `key`, as of `height`.
template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  bytes_t key;
  bytes_t value;
  int64_t height{};

  bool ok() const { return code == 0; }
};

using query_result_t = query_result<1>;

}  // namespace conduit::schema
