#include <conduit/schema/domain.hpp>

namespace conduit::schema {

std::string to_string(const domain_t& domain) {
  return std::visit(
      overloaded{[](const domain_main_t&) { return std::string{"main"}; },
                 [](const domain_external_t& value) {
                   return "external:" + value.name;
                 }},
      domain);
}

const polytone_connectors_t* polytone_of(const external_domain_t& domain) {
  auto cosmwasm =
      std::get_if<cosmwasm_environment_t>(&domain.execution_environment);
  return cosmwasm ? &cosmwasm->polytone : nullptr;
}

polytone_connectors_t* polytone_of(external_domain_t& domain) {
  auto cosmwasm =
      std::get_if<cosmwasm_environment_t>(&domain.execution_environment);
  return cosmwasm ? &cosmwasm->polytone : nullptr;
}

const hyperlane_connector_t* hyperlane_of(const external_domain_t& domain) {
  auto evm = std::get_if<evm_environment_t>(&domain.execution_environment);
  return evm ? &evm->hyperlane : nullptr;
}

}  // namespace conduit::schema
