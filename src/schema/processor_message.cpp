#include <conduit/schema/processor_message.hpp>

namespace conduit::schema {

message_type_t message_type_of(const processor_message_t& message) {
  return std::visit(
      overloaded{[](const cosmwasm_execute_msg_t&) {
                   return message_type_t::cosmwasm_execute_msg;
                 },
                 [](const cosmwasm_migrate_msg_t&) {
                   return message_type_t::cosmwasm_migrate_msg;
                 },
                 [](const evm_call_msg_t&) { return message_type_t::evm_call; },
                 [](const evm_raw_call_msg_t&) {
                   return message_type_t::evm_raw_call;
                 }},
      message);
}

const bytes_t& payload_of(const processor_message_t& message) {
  return std::visit([](const auto& value) -> const bytes_t& { return value.msg; },
                    message);
}

processor_message_t with_payload(const processor_message_t& message,
                                 bytes_t payload) {
  auto copy = message;
  std::visit([&payload](auto& value) { value.msg = std::move(payload); }, copy);
  return copy;
}

}  // namespace conduit::schema
