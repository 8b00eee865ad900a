#include <algorithm>
#include <conduit/schema/key/builder.hpp>
#include <iterator>

using namespace conduit::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), static_cast<std::ptrdiff_t>(str.size()),
                      std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy(bytes, std::back_inserter(data));
  return *this;
}
