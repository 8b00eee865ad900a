#include <conduit/blake3/hash.hpp>
#include <conduit/host/chain.hpp>
#include <conduit/schema/encoding/scale/encoder.hpp>
#include <conduit/schema/host_error_code.hpp>
#include <conduit/schema/key/builder.hpp>
#include <conduit/schema/query_result.hpp>
#include <conduit/schema/transaction.hpp>
#include <spdlog/spdlog.h>

namespace conduit::host {

namespace {

using encoder_t = conduit::schema::encoding::scale_encoder_t;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED_STATE"};
inline constexpr auto kInstantiatedPrefix = std::string_view{"SYS|INIT|"};
inline constexpr auto kContractPrefix = std::string_view{"CONTRACT|"};

conduit::schema::bytes_t instantiated_key(
    const conduit::schema::address_t& address) {
  return conduit::schema::key::builder{}
      .write(kInstantiatedPrefix)
      .write(address)
      .data;
}

response host_error(const conduit::schema::host_error_code code,
                    std::string log) {
  return make_error(code, conduit::schema::kHostCodespace, std::move(log));
}

bool wants_reply(const reply_on_t reply_on, const bool succeeded) {
  switch (reply_on) {
    case reply_on_t::always:
      return true;
    case reply_on_t::success:
      return succeeded;
    case reply_on_t::error:
      return !succeeded;
    case reply_on_t::never:
      return false;
  }
  return false;
}

}  // namespace

conduit::storage::prefixed_store contract_store(
    conduit::storage::kv_store& store,
    const conduit::schema::address_t& address) {
  return conduit::storage::prefixed_store{
      store, conduit::schema::key::builder{}
                 .write(kContractPrefix)
                 .write(address)
                 .write("|")
                 .data};
}

chain::chain(std::string chain_id,
             conduit::storage::kv_store& backend,
             const conduit::schema::timestamp_seconds_t genesis_time)
    : chain_id_{std::move(chain_id)}, backend_{backend} {
  block_.chain_id = chain_id_;
  auto committed = load_committed_state();
  if (committed) {
    block_.height = committed->height + 1;
    block_.time = committed->time + kDefaultBlockSeconds;
    app_hash_ = committed->app_hash;
    spdlog::info("Chain {} resuming at height {} (last committed {})",
                 chain_id_, block_.height, committed->height);
  } else {
    block_.height = 1;
    block_.time = genesis_time;
    spdlog::info("Chain {} starting from genesis at time {}", chain_id_,
                 genesis_time);
  }
}

void chain::register_contract(const conduit::schema::address_t& address,
                              std::shared_ptr<contract> code,
                              std::optional<conduit::schema::address_t> admin) {
  auto lock = std::scoped_lock{mutex_};
  if (contracts_.contains(address)) {
    spdlog::warn("Replacing code registered at {}", address);
  }
  contracts_.insert_or_assign(
      address, registration{.code = std::move(code), .admin = std::move(admin)});
}

bool chain::has_contract(const conduit::schema::address_t& address) const {
  auto lock = std::scoped_lock{mutex_};
  return contracts_.contains(address);
}

bool chain::is_instantiated(const conduit::schema::address_t& address) const {
  auto lock = std::scoped_lock{mutex_};
  return instantiated_in(backend_, address);
}

conduit::schema::transaction_result_t chain::instantiate(
    const conduit::schema::address_t& sender,
    const conduit::schema::address_t& address,
    const conduit::schema::bytes_view_t& msg) {
  auto lock = std::scoped_lock{mutex_};
  return run_transaction(
      sender, address, msg,
      [&](conduit::storage::kv_store& branch, events_t& events) {
        auto registered = find(address);
        if (registered == nullptr) {
          return host_error(conduit::schema::host_error_code::contract_not_found,
                            "no code registered at " + address);
        }
        if (instantiated_in(branch, address)) {
          return host_error(
              conduit::schema::host_error_code::already_instantiated,
              "contract " + address + " is already instantiated");
        }
        branch.put(instantiated_key(address), conduit::schema::bytes_t{1});
        auto store = contract_store(branch, address);
        auto result = registered->code->instantiate(
            store, make_env(address), message_info{.sender = sender}, msg);
        return settle(branch, address, std::move(result), 0, events);
      });
}

conduit::schema::transaction_result_t chain::execute(
    const conduit::schema::address_t& sender,
    const conduit::schema::address_t& contract_address,
    const conduit::schema::bytes_view_t& msg) {
  auto lock = std::scoped_lock{mutex_};
  auto wasm_msg = conduit::schema::cosmos_msg_t{conduit::schema::wasm_execute_t{
      .contract_address = contract_address,
      .msg = conduit::schema::make_bytes(msg)}};
  return run_transaction(
      sender, contract_address, msg,
      [&](conduit::storage::kv_store& branch, events_t& events) {
        return dispatch(branch, sender, wasm_msg, 0, events);
      });
}

conduit::schema::transaction_result_t chain::migrate(
    const conduit::schema::address_t& sender,
    const conduit::schema::address_t& contract_address,
    const uint64_t code_id,
    const conduit::schema::bytes_view_t& msg) {
  auto lock = std::scoped_lock{mutex_};
  auto wasm_msg = conduit::schema::cosmos_msg_t{conduit::schema::wasm_migrate_t{
      .contract_address = contract_address,
      .code_id = code_id,
      .msg = conduit::schema::make_bytes(msg)}};
  return run_transaction(
      sender, contract_address, msg,
      [&](conduit::storage::kv_store& branch, events_t& events) {
        return dispatch(branch, sender, wasm_msg, 0, events);
      });
}

conduit::schema::transaction_result_t chain::submit(
    const conduit::schema::bytes_view_t& encoded_transaction) {
  auto encoder = encoder_t{};
  auto decoded =
      encoder.try_decode<conduit::schema::transaction_t>(encoded_transaction);
  if (!decoded) {
    return conduit::schema::transaction_result_t{
        .code = static_cast<uint32_t>(
            conduit::schema::host_error_code::invalid_transaction),
        .log = "failed to decode transaction",
        .codespace = std::string{conduit::schema::kHostCodespace}};
  }
  if (decoded->chain_id != chain_id_) {
    return conduit::schema::transaction_result_t{
        .code = static_cast<uint32_t>(
            conduit::schema::host_error_code::invalid_transaction),
        .log = "transaction is for chain '" + decoded->chain_id + "'",
        .codespace = std::string{conduit::schema::kHostCodespace}};
  }
  return execute(decoded->sender, decoded->contract, decoded->msg);
}

conduit::schema::query_result_t chain::query(
    const conduit::schema::address_t& contract_address,
    const std::string_view path,
    const conduit::schema::bytes_view_t& data) const {
  auto lock = std::scoped_lock{mutex_};
  auto registered = find(contract_address);
  if (registered == nullptr || !instantiated_in(backend_, contract_address)) {
    return make_query_error(conduit::schema::query_error_code::no_contract,
                            "no contract at " + contract_address,
                            conduit::schema::kHostCodespace);
  }
  auto store = contract_store(backend_, contract_address);
  auto result =
      registered->code->query(store, make_env(contract_address), path, data);
  result.height = static_cast<int64_t>(block_.height);
  return result;
}

conduit::storage::committed_state chain::advance_block(const uint64_t blocks,
                                                       const uint64_t seconds) {
  auto lock = std::scoped_lock{mutex_};
  auto committed = conduit::storage::committed_state{
      .height = block_.height, .time = block_.time, .app_hash = app_hash_};
  auto encoder = encoder_t{};
  backend_.put(conduit::schema::make_bytes_view(kCommittedStateKey),
               encoder.encode(committed));
  block_.height += blocks;
  block_.time += seconds;
  spdlog::debug("Chain {} committed height {}, next block {} at time {}",
                chain_id_, committed.height, block_.height, block_.time);
  return committed;
}

std::optional<conduit::storage::committed_state> chain::load_committed_state()
    const {
  auto raw =
      backend_.get(conduit::schema::make_bytes_view(kCommittedStateKey));
  if (!raw) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  return encoder.decode<conduit::storage::committed_state>(*raw);
}

conduit::schema::block_info_t chain::block() const {
  auto lock = std::scoped_lock{mutex_};
  return block_;
}

conduit::schema::hash32_t chain::app_hash() const {
  auto lock = std::scoped_lock{mutex_};
  return app_hash_;
}

conduit::schema::transaction_result_t chain::run_transaction(
    const conduit::schema::address_t& sender,
    const conduit::schema::address_t& contract_address,
    const conduit::schema::bytes_view_t& msg,
    const body_t& body) {
  auto branch = conduit::storage::cache_store{backend_};
  auto events = events_t{};
  auto result = body(branch, events);

  auto tx = conduit::schema::transaction_result_t{
      .code = result.code,
      .data = result.data,
      .log = result.log,
      .codespace = result.codespace};
  if (!result.ok()) {
    spdlog::warn("Transaction from {} to {} failed [{}:{}]: {}", sender,
                 contract_address, result.codespace, result.code, result.log);
    return tx;
  }

  branch.commit();
  tx.events = std::move(events);

  auto encoder = encoder_t{};
  auto encoded = encoder.encode(conduit::schema::transaction_t{
      .chain_id = chain_id_,
      .sender = sender,
      .contract = contract_address,
      .msg = conduit::schema::make_bytes(msg)});
  app_hash_ = conduit::blake3::fold(app_hash_, encoded);
  return tx;
}

response chain::dispatch(conduit::storage::kv_store& parent,
                         const conduit::schema::address_t& sender,
                         const conduit::schema::cosmos_msg_t& msg,
                         const std::size_t depth,
                         events_t& events) {
  const auto& target = conduit::schema::target_of(msg);
  if (depth > kMaxDispatchDepth) {
    return host_error(conduit::schema::host_error_code::dispatch_depth_exceeded,
                      "dispatch depth exceeded calling " + target);
  }
  auto registered = find(target);
  if (registered == nullptr || !instantiated_in(parent, target)) {
    return host_error(conduit::schema::host_error_code::contract_not_found,
                      "no contract at " + target);
  }

  auto branch = conduit::storage::cache_store{parent};
  auto mark = events.size();
  auto store = contract_store(branch, target);
  auto environment = make_env(target);
  auto result = std::visit(
      overloaded{
          [&](const conduit::schema::wasm_execute_t& value) {
            spdlog::debug("Dispatch execute {} -> {} (depth {})", sender,
                          target, depth);
            return registered->code->execute(
                store, environment, message_info{.sender = sender},
                value.msg);
          },
          [&](const conduit::schema::wasm_migrate_t& value) {
            if (!registered->admin || *registered->admin != sender) {
              return host_error(
                  conduit::schema::host_error_code::unauthorized_migration,
                  sender + " is not the admin of " + target);
            }
            spdlog::debug("Dispatch migrate {} -> {} code {}", sender, target,
                          value.code_id);
            return registered->code->migrate(store, environment, value.code_id,
                                             value.msg);
          }},
      msg);

  result = settle(branch, target, std::move(result), depth, events);
  if (!result.ok()) {
    events.resize(mark);
    return result;
  }
  branch.commit();
  return result;
}

response chain::run_reply(conduit::storage::kv_store& parent,
                          const conduit::schema::address_t& address,
                          const reply& outcome,
                          const std::size_t depth,
                          events_t& events) {
  auto registered = find(address);
  if (registered == nullptr) {
    return host_error(conduit::schema::host_error_code::contract_not_found,
                      "no contract at " + address);
  }
  auto branch = conduit::storage::cache_store{parent};
  auto mark = events.size();
  auto store = contract_store(branch, address);
  auto result = registered->code->reply(store, make_env(address), outcome);
  result = settle(branch, address, std::move(result), depth, events);
  if (!result.ok()) {
    events.resize(mark);
    return result;
  }
  branch.commit();
  return result;
}

response chain::settle(conduit::storage::kv_store& branch,
                       const conduit::schema::address_t& address,
                       response result,
                       const std::size_t depth,
                       events_t& events) {
  if (!result.ok()) {
    return result;
  }

  auto event = conduit::schema::contract_event_t{.type = "wasm"};
  event.attributes.push_back(conduit::schema::event_attribute_t{
      .key = "_contract_address", .value = address});
  event.attributes.insert(std::end(event.attributes),
                          std::begin(result.attributes),
                          std::end(result.attributes));
  events.push_back(std::move(event));

  for (const auto& message : result.messages) {
    auto outcome = dispatch(branch, address, message.msg, depth + 1, events);
    if (!wants_reply(message.reply_on, outcome.ok())) {
      if (!outcome.ok()) {
        return outcome;
      }
      continue;
    }
    auto delivered = reply{.id = message.id, .data = outcome.data};
    if (!outcome.ok()) {
      delivered.error = outcome.log;
    }
    auto replied = run_reply(branch, address, delivered, depth + 1, events);
    if (!replied.ok()) {
      return replied;
    }
  }
  return result;
}

const chain::registration* chain::find(
    const conduit::schema::address_t& address) const {
  auto it = contracts_.find(address);
  return it == std::end(contracts_) ? nullptr : &it->second;
}

bool chain::instantiated_in(const conduit::storage::kv_store& store,
                            const conduit::schema::address_t& address) const {
  return store.get(instantiated_key(address)).has_value();
}

env chain::make_env(const conduit::schema::address_t& address) const {
  return env{.block = block_, .contract_address = address};
}

}  // namespace conduit::host
