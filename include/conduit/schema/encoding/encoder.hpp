#pragma once
#include <conduit/schema/primitives.hpp>
#include <optional>
#include <span>

namespace conduit::schema::encoding {

/// Wire codec selected at build time through the Library tag. Every contract
/// message, stored value and query payload goes through one of these.
template <typename Library>
struct encoder {
  template <typename T>
  conduit::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const conduit::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const conduit::schema::bytes_view_t& bytes);
};

}  // namespace conduit::schema::encoding
