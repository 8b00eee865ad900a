#include <conduit/schema/subroutine.hpp>

namespace conduit::schema {

std::size_t function_count(const subroutine_t& subroutine) {
  return std::visit([](const auto& value) { return value.functions.size(); },
                    subroutine);
}

const domain_t& function_domain(const subroutine_t& subroutine,
                                const std::size_t index) {
  return std::visit(
      [index](const auto& value) -> const domain_t& {
        return value.functions.at(index).domain;
      },
      subroutine);
}

const address_t& function_contract(const subroutine_t& subroutine,
                                   const std::size_t index) {
  return std::visit(
      [index](const auto& value) -> const address_t& {
        return value.functions.at(index).contract_address;
      },
      subroutine);
}

const message_details_t& function_message_details(
    const subroutine_t& subroutine,
    const std::size_t index) {
  return std::visit(
      [index](const auto& value) -> const message_details_t& {
        return value.functions.at(index).message_details;
      },
      subroutine);
}

std::optional<retry_logic_t> retry_logic_for(const subroutine_t& subroutine,
                                             const std::size_t index) {
  return std::visit(
      overloaded{[](const atomic_subroutine_t& value) {
                   return value.retry_logic;
                 },
                 [index](const non_atomic_subroutine_t& value) {
                   if (index >= value.functions.size()) {
                     return std::optional<retry_logic_t>{};
                   }
                   return value.functions[index].retry_logic;
                 }},
      subroutine);
}

std::optional<function_callback_t> callback_confirmation_for(
    const subroutine_t& subroutine,
    const std::size_t index) {
  auto non_atomic = std::get_if<non_atomic_subroutine_t>(&subroutine);
  if (non_atomic == nullptr || index >= non_atomic->functions.size()) {
    return std::nullopt;
  }
  return non_atomic->functions[index].callback_confirmation;
}

std::optional<duration_seconds_t> expiration_time_of(
    const subroutine_t& subroutine) {
  return std::visit([](const auto& value) { return value.expiration_time; },
                    subroutine);
}

}  // namespace conduit::schema
