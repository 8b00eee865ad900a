#pragma once

#include <conduit/schema/primitives.hpp>
#include <cstdint>

// Schema type: transaction.
// Envelope the daemon reads from its input feed: one contract call signed
// off by the host as coming from `sender`.
namespace conduit::schema {

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  std::string chain_id;
  address_t sender;
  address_t contract;
  bytes_t msg;
};

using transaction_t = transaction<1>;

}  // namespace conduit::schema
