#include <conduit/host/contract.hpp>
#include <conduit/schema/host_error_code.hpp>

namespace conduit::host {

response contract::reply(conduit::storage::kv_store&,
                         const env& environment,
                         const host::reply& outcome) {
  return make_error(conduit::schema::host_error_code::unsupported_entry_point,
                    conduit::schema::kHostCodespace,
                    "contract " + environment.contract_address +
                        " does not handle reply " + std::to_string(outcome.id));
}

response contract::migrate(conduit::storage::kv_store&,
                           const env& environment,
                           uint64_t,
                           const conduit::schema::bytes_view_t&) {
  return make_error(conduit::schema::host_error_code::unsupported_entry_point,
                    conduit::schema::kHostCodespace,
                    "contract " + environment.contract_address +
                        " does not support migration");
}

}  // namespace conduit::host
