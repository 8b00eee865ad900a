#include <conduit/schema/authorization.hpp>

namespace conduit::schema {

authorization_t make_authorization(const authorization_info_t& info,
                                   const block_info_t& block) {
  auto expiration = std::visit(
      overloaded{[](const lifetime_forever_t&) -> expiration_t {
                   return expiration_never_t{};
                 },
                 [&block](const lifetime_seconds_t& value) {
                   return expires_after(
                       duration_time_t{.seconds = value.seconds}, block);
                 },
                 [&block](const lifetime_blocks_t& value) {
                   return expires_after(
                       duration_height_t{.blocks = value.blocks}, block);
                 }},
      info.duration);

  return authorization_t{
      .label = info.label,
      .mode = info.mode,
      .not_before = info.not_before,
      .expiration = expiration,
      .max_concurrent_executions = info.max_concurrent_executions.value_or(
          kDefaultMaxConcurrentExecutions),
      .subroutine = info.subroutine,
      .priority = info.priority.value_or(priority_t::medium),
      .state = authorization_state_t::enabled};
}

const domain_t& target_domain(const authorization_t& authorization) {
  return function_domain(authorization.subroutine, 0);
}

}  // namespace conduit::schema
