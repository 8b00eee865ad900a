#include <conduit/schema/expiration.hpp>
#include <spdlog/fmt/fmt.h>

namespace conduit::schema {

bool is_expired(const expiration_t& expiration, const block_info_t& block) {
  return std::visit(
      overloaded{
          [](const expiration_never_t&) { return false; },
          [&block](const expiration_at_height_t& value) {
            return block.height >= value.height;
          },
          [&block](const expiration_at_time_t& value) {
            return block.time >= value.time;
          }},
      expiration);
}

expiration_t expires_after(const duration_t& duration,
                           const block_info_t& block) {
  return std::visit(
      overloaded{[&block](const duration_height_t& value) -> expiration_t {
                   return expiration_at_height_t{
                       .height = block.height + value.blocks};
                 },
                 [&block](const duration_time_t& value) -> expiration_t {
                   return expiration_at_time_t{.time =
                                                   block.time + value.seconds};
                 }},
      duration);
}

std::string to_string(const expiration_t& expiration) {
  return std::visit(
      overloaded{
          [](const expiration_never_t&) { return std::string{"never"}; },
          [](const expiration_at_height_t& value) {
            return fmt::format("height:{}", value.height);
          },
          [](const expiration_at_time_t& value) {
            return fmt::format("time:{}", value.time);
          }},
      expiration);
}

}  // namespace conduit::schema
