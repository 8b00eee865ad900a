#pragma once

#include <conduit/host/response.hpp>
#include <conduit/schema/primitives.hpp>
#include <conduit/schema/query_result.hpp>
#include <conduit/storage/storage.hpp>
#include <cstdint>
#include <string_view>

namespace conduit::host {

/// Code the host runs for a registered address. Every entry point receives
/// the contract's own namespaced store, already branched by the host so a
/// failing response leaves no trace.
class contract {
 public:
  virtual ~contract() = default;

  virtual response instantiate(conduit::storage::kv_store& store,
                               const env& environment,
                               const message_info& info,
                               const conduit::schema::bytes_view_t& msg) = 0;

  virtual response execute(conduit::storage::kv_store& store,
                           const env& environment,
                           const message_info& info,
                           const conduit::schema::bytes_view_t& msg) = 0;

  /// Outcome of a sub-message this contract dispatched with reply_on set.
  virtual response reply(conduit::storage::kv_store& store,
                         const env& environment,
                         const host::reply& outcome);

  virtual response migrate(conduit::storage::kv_store& store,
                           const env& environment,
                           uint64_t code_id,
                           const conduit::schema::bytes_view_t& msg);

  /// Read-only lookup routed by path; the value is SCALE encoded.
  virtual conduit::schema::query_result_t query(
      const conduit::storage::kv_store& store,
      const env& environment,
      std::string_view path,
      const conduit::schema::bytes_view_t& data) const = 0;
};

}  // namespace conduit::host
