#include <conduit/schema/execution_result.hpp>
#include <conduit/schema/primitives.hpp>
#include <spdlog/fmt/fmt.h>

namespace conduit::schema {

bool is_terminal(const execution_result_t& result) {
  if (std::holds_alternative<result_in_process_t>(result)) {
    return false;
  }
  if (auto timeout = std::get_if<result_timeout_t>(&result)) {
    return !timeout->retriable;
  }
  return true;
}

bool is_nothing_executed(const execution_result_t& result) {
  return std::visit(
      overloaded{[](const result_success_t&) { return false; },
                 [](const result_partially_executed_t& value) {
                   return value.executed_count == 0;
                 },
                 [](const result_expired_t& value) {
                   return value.executed_count == 0;
                 },
                 [](const auto&) { return true; }},
      result);
}

std::string to_string(const execution_result_t& result) {
  return std::visit(
      overloaded{
          [](const result_in_process_t&) { return std::string{"in_process"}; },
          [](const result_success_t&) { return std::string{"success"}; },
          [](const result_rejected_t& value) {
            return fmt::format("rejected({})", value.error);
          },
          [](const result_partially_executed_t& value) {
            return fmt::format("partially_executed({}, {})",
                               value.executed_count, value.error);
          },
          [](const result_removed_by_owner_t&) {
            return std::string{"removed_by_owner"};
          },
          [](const result_timeout_t& value) {
            return fmt::format("timeout(retriable={})", value.retriable);
          },
          [](const result_expired_t& value) {
            return fmt::format("expired({})", value.executed_count);
          },
          [](const result_unexpected_error_t& value) {
            return fmt::format("unexpected_error({})", value.error);
          }},
      result);
}

}  // namespace conduit::schema
