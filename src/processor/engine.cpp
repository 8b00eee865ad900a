#include <conduit/processor/engine.hpp>
#include <conduit/router/router.hpp>
#include <conduit/schema/authorization_msg.hpp>
#include <conduit/schema/encoding/scale/encoder.hpp>
#include <conduit/schema/page_request.hpp>
#include <conduit/schema/processor_error_code.hpp>
#include <conduit/schema/processor_state.hpp>
#include <conduit/storage/deque.hpp>
#include <conduit/storage/item.hpp>
#include <conduit/storage/map.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

using namespace conduit::schema;

namespace conduit::processor {

namespace {

using encoder_t = conduit::schema::encoding::scale_encoder_t;

inline constexpr auto kMainDomainProxyTag = std::string_view{"main"};
inline constexpr auto kInvalidConfirmation =
    std::string_view{"Invalid callback message received"};

const auto kConfig = conduit::storage::item<processor_config_t>{"config"};
const auto kOwner = conduit::storage::item<address_t>{"owner"};
const auto kNextReplyId = conduit::storage::item<uint64_t>{"next_reply_id"};
const auto kHighQueue = conduit::storage::deque<message_batch_t>{"queue_high"};
const auto kMediumQueue =
    conduit::storage::deque<message_batch_t>{"queue_medium"};
const auto kRetries =
    conduit::storage::map<uint64_t, current_retry_t>{"retries"};
const auto kFunctionIndex =
    conduit::storage::map<uint64_t, uint64_t>{"function_index"};
const auto kPendingOperations =
    conduit::storage::map<uint64_t, pending_operation_t>{"pending_operations"};
const auto kPendingConfirmations =
    conduit::storage::map<uint64_t, pending_confirmation_t>{
        "pending_confirmations"};
const auto kPendingCallbacks =
    conduit::storage::map<uint64_t, pending_bridge_callback_t>{
        "pending_callbacks"};

const conduit::storage::deque<message_batch_t>& lane(
    const priority_t priority) {
  return priority == priority_t::high ? kHighQueue : kMediumQueue;
}

conduit::host::response processor_error(const processor_error_code code,
                                        std::string log) {
  spdlog::warn("Processor rejected call: {}", log);
  return conduit::host::make_error(code, kProcessorCodespace, std::move(log));
}

cosmos_msg_t to_cosmos_msg(const address_t& contract,
                           const processor_message_t& message) {
  return std::visit(
      overloaded{[&](const cosmwasm_migrate_msg_t& value) -> cosmos_msg_t {
                   return wasm_migrate_t{.contract_address = contract,
                                         .code_id = value.code_id,
                                         .msg = value.msg};
                 },
                 [&](const auto& value) -> cosmos_msg_t {
                   return wasm_execute_t{.contract_address = contract,
                                         .msg = value.msg};
                 }},
      message);
}

/// Adds `execution_id` to the method body so the library can confirm.
processor_message_t with_execution_id(const processor_message_t& message,
                                      const execution_id_t execution_id) {
  const auto& payload = payload_of(message);
  auto root = nlohmann::json::parse(std::begin(payload), std::end(payload),
                                    nullptr, false);
  if (root.is_discarded() || !root.is_object() || root.size() != 1 ||
      !root.begin()->is_object()) {
    return message;
  }
  (*root.begin())["execution_id"] = execution_id;
  return with_payload(message, make_bytes(root.dump()));
}

std::string describe(const message_batch_t& batch) {
  return fmt::format("execution {} ({}, {} message(s))", batch.execution_id,
                     is_atomic(batch.subroutine) ? "atomic" : "non-atomic",
                     batch.msgs.size());
}

message_batch_t make_batch(const execution_id_t execution_id,
                           std::vector<processor_message_t> msgs,
                           subroutine_t subroutine,
                           const priority_t priority,
                           const std::optional<timestamp_seconds_t>&
                               expiration_time) {
  return message_batch_t{.execution_id = execution_id,
                         .msgs = std::move(msgs),
                         .subroutine = std::move(subroutine),
                         .priority = priority,
                         .expiration_time = expiration_time};
}

template <typename T>
conduit::schema::query_result_t encoded_value(const std::string_view path,
                                              const T& value) {
  auto encoder = encoder_t{};
  return conduit::host::make_query_value(make_bytes(path),
                                         encoder.encode(value));
}

}  // namespace

conduit::host::response engine::instantiate(
    conduit::storage::kv_store& store,
    const conduit::host::env& environment,
    const conduit::host::message_info&,
    const bytes_view_t& msg) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<processor_instantiate_t>(msg);
  if (!decoded) {
    return processor_error(processor_error_code::invalid_message,
                           "invalid instantiate message");
  }
  auto config =
      processor_config_t{.authorization_contract =
                             decoded->authorization_contract,
                         .processor_domain = decoded->processor_domain,
                         .state = processor_state_t::active};
  auto result = conduit::host::response{};
  if (auto* polytone =
          std::get_if<processor_domain_polytone_t>(&config.processor_domain)) {
    polytone->proxy_on_main_domain_state = polytone_proxy_state_t{};
    result.add_message(router::create_proxy_message(
        polytone->polytone_note_address, polytone->timeout_seconds,
        environment.contract_address,
        polytone_tag_create_proxy_t{.domain_name =
                                        std::string{kMainDomainProxyTag}}));
  }
  kOwner.save(store, decoded->owner);
  kConfig.save(store, config);
  kNextReplyId.save(store, 1);
  spdlog::info("Processor {} instantiated for authorization contract {}",
               environment.contract_address, config.authorization_contract);
  result.add_attribute("method", "instantiate")
      .add_attribute("authorization_contract", config.authorization_contract);
  return result;
}

conduit::host::response engine::execute(
    conduit::storage::kv_store& store,
    const conduit::host::env& environment,
    const conduit::host::message_info& info,
    const bytes_view_t& msg) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<processor_execute_msg_t>(msg);
  if (!decoded) {
    return processor_error(processor_error_code::invalid_message,
                           "failed to decode processor message");
  }
  return std::visit(
      overloaded{
          [&](const update_config_t& value) {
            return update_config(store, info, value);
          },
          [&](const authorization_module_msg_t& value) {
            auto config = kConfig.load(store);
            if (!is_authorization_module(config, info.sender)) {
              return processor_error(
                  processor_error_code::unauthorized,
                  fmt::format("{} is not the authorization module",
                              info.sender));
            }
            return authorization_module_action(store, environment, value);
          },
          [&](const processor_permissionless_msg_t& value) {
            return std::visit(
                overloaded{[&](const tick_t&) {
                             return tick(store, environment);
                           },
                           [&](const retry_callback_t& retry) {
                             return retry_callback(store, environment, retry);
                           },
                           [&](const retry_proxy_creation_t&) {
                             return retry_proxy_creation(store, environment);
                           }},
                value);
          },
          [&](const internal_processor_msg_t& value) {
            return std::visit(
                overloaded{
                    [&](const function_confirmation_t& confirmation) {
                      return function_confirmation(store, environment, info,
                                                   confirmation);
                    },
                    [&](const execute_atomic_t& atomic) {
                      return execute_atomic(environment, info, atomic);
                    }},
                value);
          },
          [&](const polytone_callback_message_t& value) {
            return polytone_callback(store, environment, info, value);
          },
          [&](const hyperlane_handle_t& value) {
            return hyperlane_callback(store, environment, info, value);
          }},
      *decoded);
}

conduit::host::response engine::update_config(
    conduit::storage::kv_store& store,
    const conduit::host::message_info& info,
    const update_config_t& msg) {
  if (kOwner.load(store) != info.sender) {
    return processor_error(processor_error_code::unauthorized,
                           fmt::format("{} is not the owner", info.sender));
  }
  auto config = kConfig.load(store);
  if (msg.authorization_contract) {
    config.authorization_contract = *msg.authorization_contract;
  }
  if (msg.processor_domain) {
    config.processor_domain = *msg.processor_domain;
  }
  kConfig.save(store, config);
  auto result = conduit::host::response{};
  result.add_attribute("method", "update_config")
      .add_attribute("authorization_contract", config.authorization_contract);
  return result;
}

conduit::host::response engine::authorization_module_action(
    conduit::storage::kv_store& store,
    const conduit::host::env& environment,
    const authorization_module_msg_t& msg) {
  auto result = conduit::host::response{};
  auto error = std::visit(
      overloaded{
          [&](const enqueue_msgs_t& value)
              -> std::optional<conduit::host::response> {
            auto batch = make_batch(value.execution_id, value.msgs,
                                    value.subroutine, value.priority,
                                    value.expiration_time);
            lane(value.priority).push_back(store, batch);
            spdlog::debug("Enqueued {} in the {} lane", describe(batch),
                          to_string(value.priority));
            result.add_attribute("method", "enqueue_msgs")
                .add_attribute("execution_id",
                               std::to_string(value.execution_id));
            return std::nullopt;
          },
          [&](const evict_msgs_t& value)
              -> std::optional<conduit::host::response> {
            auto evicted = evict(store, environment, value);
            if (!evicted.ok()) {
              return evicted;
            }
            result = std::move(evicted);
            return std::nullopt;
          },
          [&](const insert_msgs_t& value)
              -> std::optional<conduit::host::response> {
            auto batch = make_batch(value.execution_id, value.msgs,
                                    value.subroutine, value.priority,
                                    value.expiration_time);
            if (!lane(value.priority)
                     .insert_at(store, value.queue_position, batch)) {
              return processor_error(
                  processor_error_code::queue_position_out_of_range,
                  fmt::format("cannot insert at position {} of the {} lane",
                              value.queue_position,
                              to_string(value.priority)));
            }
            result.add_attribute("method", "insert_msgs")
                .add_attribute("execution_id",
                               std::to_string(value.execution_id));
            return std::nullopt;
          },
          [&](const pause_t&) -> std::optional<conduit::host::response> {
            auto config = kConfig.load(store);
            config.state = processor_state_t::paused;
            kConfig.save(store, config);
            spdlog::info("Processor {} paused", environment.contract_address);
            result.add_attribute("method", "pause");
            return std::nullopt;
          },
          [&](const resume_t&) -> std::optional<conduit::host::response> {
            auto config = kConfig.load(store);
            config.state = processor_state_t::active;
            kConfig.save(store, config);
            spdlog::info("Processor {} resumed", environment.contract_address);
            result.add_attribute("method", "resume");
            return std::nullopt;
          }},
      msg);
  if (error) {
    return std::move(*error);
  }
  return result;
}

conduit::host::response engine::evict(conduit::storage::kv_store& store,
                                      const conduit::host::env& environment,
                                      const evict_msgs_t& msg) {
  const auto& queue = lane(msg.priority);
  auto batch = queue.at(store, msg.queue_position);
  if (!batch) {
    return processor_error(
        processor_error_code::queue_position_out_of_range,
        fmt::format("no batch at position {} of the {} lane",
                    msg.queue_position, to_string(msg.priority)));
  }
  if (!is_atomic(batch->subroutine) &&
      (kFunctionIndex.may_load(store, batch->execution_id).value_or(0) > 0 ||
       kRetries.has(store, batch->execution_id) ||
       kPendingConfirmations.has(store, batch->execution_id))) {
    return processor_error(
        processor_error_code::batch_in_progress,
        fmt::format("{} has already started", describe(*batch)));
  }

  auto result = conduit::host::response{};
  finalize(store, environment,
           batch_location{.priority = msg.priority,
                          .position = msg.queue_position,
                          .batch = *batch},
           result_removed_by_owner_t{}, result);
  result.add_attribute("method", "evict_msgs")
      .add_attribute("execution_id", std::to_string(batch->execution_id));
  return result;
}

conduit::host::response engine::tick(conduit::storage::kv_store& store,
                                     const conduit::host::env& environment) {
  auto config = kConfig.load(store);
  if (config.state == processor_state_t::paused) {
    return processor_error(processor_error_code::processor_paused,
                           "processor is paused");
  }

  auto result = conduit::host::response{};
  result.add_attribute("method", "tick");
  if (auto expired = expire_batches(store, environment, result); expired > 0) {
    result.add_attribute("action", "expired")
        .add_attribute("expired_count", std::to_string(expired));
    return result;
  }

  auto priority = kHighQueue.empty(store) ? priority_t::medium
                                          : priority_t::high;
  auto head = lane(priority).front(store);
  if (!head) {
    result.add_attribute("action", "queues_empty");
    return result;
  }

  const auto& batch = *head;
  auto index = static_cast<std::size_t>(
      kFunctionIndex.may_load(store, batch.execution_id).value_or(0));

  if (kPendingConfirmations.has(store, batch.execution_id)) {
    result.add_attribute("action", "awaiting_confirmation");
    return result;
  }
  if (auto retry = kRetries.may_load(store, batch.execution_id);
      retry && !is_expired(retry->retry_cooldown, environment.block)) {
    spdlog::debug("{} cooling down until {}", describe(batch),
                  to_string(retry->retry_cooldown));
    result.add_attribute("action", "retry_cooldown");
    return result;
  }

  auto reply_id = next_reply_id(store);
  auto encoder = encoder_t{};
  if (is_atomic(batch.subroutine)) {
    kPendingOperations.save(
        store, reply_id,
        pending_operation_t{.execution_id = batch.execution_id,
                            .kind = operation_kind_t::atomic_batch});
    auto self_call = wasm_execute_t{
        .contract_address = environment.contract_address,
        .msg = encoder.encode(processor_execute_msg_t{
            internal_processor_msg_t{execute_atomic_t{.batch = batch}}})};
    result.add_submessage(
        conduit::host::sub_msg{.id = reply_id,
                               .msg = std::move(self_call),
                               .reply_on = conduit::host::reply_on_t::always});
    spdlog::debug("Executing {} atomically", describe(batch));
    result.add_attribute("action", "execute_atomic");
  } else {
    auto message = batch.msgs.at(index);
    if (callback_confirmation_for(batch.subroutine, index)) {
      message = with_execution_id(message, batch.execution_id);
    }
    kPendingOperations.save(
        store, reply_id,
        pending_operation_t{.execution_id = batch.execution_id,
                            .kind = operation_kind_t::non_atomic_function,
                            .function_index = index});
    result.add_submessage(conduit::host::sub_msg{
        .id = reply_id,
        .msg = to_cosmos_msg(function_contract(batch.subroutine, index),
                             message),
        .reply_on = conduit::host::reply_on_t::always});
    spdlog::debug("Executing function {} of {}", index, describe(batch));
    result.add_attribute("action", "execute_function")
        .add_attribute("function_index", std::to_string(index));
  }
  result.add_attribute("execution_id", std::to_string(batch.execution_id));
  return result;
}

conduit::host::response engine::reply(conduit::storage::kv_store& store,
                                      const conduit::host::env& environment,
                                      const conduit::host::reply& outcome) {
  auto operation = kPendingOperations.may_load(store, outcome.id);
  if (!operation) {
    return processor_error(processor_error_code::unknown_reply_id,
                           fmt::format("unknown reply id {}", outcome.id));
  }
  kPendingOperations.remove(store, outcome.id);
  auto location = find_batch(store, operation->execution_id);
  if (!location) {
    return processor_error(
        processor_error_code::batch_not_found,
        fmt::format("no queued batch for execution {}",
                    operation->execution_id));
  }

  auto result = conduit::host::response{};
  result.add_attribute("method", "reply")
      .add_attribute("execution_id", std::to_string(operation->execution_id));
  auto index = static_cast<std::size_t>(operation->function_index);
  if (!outcome.ok()) {
    handle_failure(store, environment, *location, index, *outcome.error,
                   result);
    return result;
  }
  if (operation->kind == operation_kind_t::atomic_batch) {
    finalize(store, environment, *location, result_success_t{}, result);
    return result;
  }
  if (auto confirmation =
          callback_confirmation_for(location->batch.subroutine, index)) {
    kPendingConfirmations.save(
        store, operation->execution_id,
        pending_confirmation_t{
            .execution_id = operation->execution_id,
            .address = confirmation->contract_address,
            .callback_msg = confirmation->callback_message,
            .function_index = index});
    result.add_attribute("action", "awaiting_confirmation");
    return result;
  }
  advance(store, environment, *location, index, result);
  return result;
}

conduit::host::response engine::function_confirmation(
    conduit::storage::kv_store& store,
    const conduit::host::env& environment,
    const conduit::host::message_info& info,
    const function_confirmation_t& msg) {
  auto pending = kPendingConfirmations.may_load(store, msg.execution_id);
  if (!pending) {
    return processor_error(
        processor_error_code::pending_confirmation_not_found,
        fmt::format("execution {} awaits no confirmation", msg.execution_id));
  }
  if (info.sender != pending->address) {
    return processor_error(
        processor_error_code::invalid_confirmation_sender,
        fmt::format("{} may not confirm execution {}", info.sender,
                    msg.execution_id));
  }
  kPendingConfirmations.remove(store, msg.execution_id);
  auto location = find_batch(store, msg.execution_id);
  if (!location) {
    return processor_error(
        processor_error_code::batch_not_found,
        fmt::format("no queued batch for execution {}", msg.execution_id));
  }

  auto result = conduit::host::response{};
  result.add_attribute("method", "function_confirmation")
      .add_attribute("execution_id", std::to_string(msg.execution_id));
  auto index = static_cast<std::size_t>(pending->function_index);
  if (msg.msg != pending->callback_msg) {
    handle_failure(store, environment, *location, index,
                   std::string{kInvalidConfirmation}, result);
  } else {
    advance(store, environment, *location, index, result);
  }
  return result;
}

conduit::host::response engine::execute_atomic(
    const conduit::host::env& environment,
    const conduit::host::message_info& info,
    const execute_atomic_t& msg) const {
  if (info.sender != environment.contract_address) {
    return processor_error(processor_error_code::unauthorized,
                           "only the processor may execute atomic batches");
  }
  const auto& batch = msg.batch;
  if (batch.msgs.size() != function_count(batch.subroutine)) {
    return processor_error(
        processor_error_code::invalid_message,
        fmt::format("{} does not match its subroutine", describe(batch)));
  }
  auto result = conduit::host::response{};
  for (auto index = std::size_t{0}; index < batch.msgs.size(); ++index) {
    result.add_message(to_cosmos_msg(function_contract(batch.subroutine, index),
                                     batch.msgs[index]));
  }
  result.add_attribute("method", "execute_atomic")
      .add_attribute("execution_id", std::to_string(batch.execution_id));
  return result;
}

conduit::host::response engine::retry_callback(
    conduit::storage::kv_store& store,
    const conduit::host::env& environment,
    const retry_callback_t& msg) {
  auto pending = kPendingCallbacks.may_load(store, msg.execution_id);
  if (!pending) {
    return processor_error(
        processor_error_code::pending_callback_not_found,
        fmt::format("no pending callback for execution {}", msg.execution_id));
  }
  if (pending->bridge.delivery != bridge_delivery_t::timed_out) {
    return processor_error(
        processor_error_code::callback_not_retriable,
        fmt::format("callback for execution {} is {}", msg.execution_id,
                    to_string(pending->bridge.delivery)));
  }
  pending->bridge = bridge_state_t{.delivery = bridge_delivery_t::pending};
  kPendingCallbacks.save(store, msg.execution_id, *pending);

  auto result = conduit::host::response{};
  result.add_message(make_callback(store, environment, msg.execution_id,
                                   pending->execution_result));
  result.add_attribute("method", "retry_callback")
      .add_attribute("execution_id", std::to_string(msg.execution_id));
  return result;
}

conduit::host::response engine::retry_proxy_creation(
    conduit::storage::kv_store& store,
    const conduit::host::env& environment) {
  auto config = kConfig.load(store);
  auto* polytone =
      std::get_if<processor_domain_polytone_t>(&config.processor_domain);
  if (polytone == nullptr) {
    return processor_error(processor_error_code::not_polytone_domain,
                           "processor is not bridged through Polytone");
  }
  if (polytone->proxy_on_main_domain_state.status !=
      polytone_proxy_status_t::timed_out) {
    return processor_error(
        processor_error_code::proxy_creation_not_retriable,
        fmt::format("proxy on the main domain is {}",
                    to_string(polytone->proxy_on_main_domain_state.status)));
  }
  polytone->proxy_on_main_domain_state = polytone_proxy_state_t{};
  kConfig.save(store, config);

  auto result = conduit::host::response{};
  result.add_message(router::create_proxy_message(
      polytone->polytone_note_address, polytone->timeout_seconds,
      environment.contract_address,
      polytone_tag_create_proxy_t{.domain_name =
                                      std::string{kMainDomainProxyTag}}));
  result.add_attribute("method", "retry_proxy_creation");
  return result;
}

conduit::host::response engine::polytone_callback(
    conduit::storage::kv_store& store,
    const conduit::host::env& environment,
    const conduit::host::message_info& info,
    const polytone_callback_message_t& msg) {
  auto config = kConfig.load(store);
  auto* polytone =
      std::get_if<processor_domain_polytone_t>(&config.processor_domain);
  if (polytone == nullptr || info.sender != polytone->polytone_note_address) {
    return processor_error(
        processor_error_code::unauthorized,
        fmt::format("{} is not this processor's note", info.sender));
  }
  if (msg.initiator != environment.contract_address) {
    return processor_error(
        processor_error_code::unauthorized,
        fmt::format("callback initiated by {}", msg.initiator));
  }
  auto tag = router::decode_tag(msg.initiator_msg);
  if (!tag) {
    return processor_error(processor_error_code::invalid_message,
                           "unrecognised Polytone callback tag");
  }

  auto result = conduit::host::response{};
  result.add_attribute("method", "polytone_callback");
  auto error = std::visit(
      overloaded{
          [&](const polytone_tag_create_proxy_t&)
              -> std::optional<conduit::host::response> {
            polytone->proxy_on_main_domain_state =
                router::next_proxy_state(msg.result);
            kConfig.save(store, config);
            spdlog::info(
                "Processor proxy on the main domain is {}",
                to_string(polytone->proxy_on_main_domain_state.status));
            result.add_attribute(
                "proxy_state",
                std::string{
                    to_string(polytone->proxy_on_main_domain_state.status)});
            return std::nullopt;
          },
          [&](const polytone_tag_execution_id_t& value)
              -> std::optional<conduit::host::response> {
            auto pending = kPendingCallbacks.may_load(store, value.execution_id);
            if (!pending) {
              return processor_error(
                  processor_error_code::pending_callback_not_found,
                  fmt::format("no pending callback for execution {}",
                              value.execution_id));
            }
            pending->bridge = router::bridge_state_of(msg.result);
            if (pending->bridge.delivery == bridge_delivery_t::delivered) {
              kPendingCallbacks.remove(store, value.execution_id);
            } else {
              spdlog::warn("Callback for execution {} not delivered: {}",
                           value.execution_id, pending->bridge.error);
              kPendingCallbacks.save(store, value.execution_id, *pending);
            }
            result.add_attribute("execution_id",
                                 std::to_string(value.execution_id))
                .add_attribute("delivery",
                               std::string{to_string(pending->bridge.delivery)});
            return std::nullopt;
          }},
      *tag);
  if (error) {
    return std::move(*error);
  }
  return result;
}

conduit::host::response engine::hyperlane_callback(
    conduit::storage::kv_store& store,
    const conduit::host::env& environment,
    const conduit::host::message_info& info,
    const hyperlane_handle_t& msg) {
  auto config = kConfig.load(store);
  const auto* hyperlane =
      std::get_if<processor_domain_hyperlane_t>(&config.processor_domain);
  if (hyperlane == nullptr || info.sender != hyperlane->mailbox ||
      msg.origin != hyperlane->main_domain_id ||
      msg.sender != config.authorization_contract) {
    return processor_error(
        processor_error_code::unauthorized,
        fmt::format("mailbox delivery from {} via {} is not accepted",
                    msg.sender, info.sender));
  }
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<processor_execute_msg_t>(msg.body);
  const auto* action =
      decoded ? std::get_if<authorization_module_msg_t>(&*decoded) : nullptr;
  if (action == nullptr) {
    return processor_error(processor_error_code::invalid_message,
                           "mailbox body is not an authorization action");
  }
  return authorization_module_action(store, environment, *action);
}

void engine::advance(conduit::storage::kv_store& store,
                     const conduit::host::env& environment,
                     const batch_location& location,
                     const std::size_t index,
                     conduit::host::response& result) {
  const auto& batch = location.batch;
  auto next = index + 1;
  if (next >= function_count(batch.subroutine)) {
    finalize(store, environment, location, result_success_t{}, result);
    return;
  }
  kFunctionIndex.save(store, batch.execution_id, next);
  kRetries.remove(store, batch.execution_id);
  result.add_attribute("action", "advanced")
      .add_attribute("function_index", std::to_string(next));
}

void engine::handle_failure(conduit::storage::kv_store& store,
                            const conduit::host::env& environment,
                            const batch_location& location,
                            const std::size_t index,
                            const std::string& error,
                            conduit::host::response& result) {
  const auto& batch = location.batch;
  auto retry_logic = retry_logic_for(batch.subroutine, index);
  auto previous = kRetries.may_load(store, batch.execution_id);
  auto attempts = (previous ? previous->retry_amounts : 0) + 1;

  auto exhausted = !retry_logic;
  if (retry_logic) {
    if (const auto* amount = std::get_if<retry_amount_t>(&retry_logic->times)) {
      exhausted = attempts >= amount->amount;
    }
  }
  if (exhausted) {
    spdlog::info("{} failed at function {}: {}", describe(batch), index, error);
    auto outcome = is_atomic(batch.subroutine)
                       ? execution_result_t{result_rejected_t{.error = error}}
                       : execution_result_t{result_partially_executed_t{
                             .executed_count = index, .error = error}};
    finalize(store, environment, location, outcome, result);
    return;
  }

  auto retry = current_retry_t{
      .retry_amounts = attempts,
      .retry_cooldown = expires_after(retry_logic->interval, environment.block)};
  kRetries.save(store, batch.execution_id, retry);
  spdlog::info("{} failed at function {} (attempt {}), retrying after {}: {}",
               describe(batch), index, attempts,
               to_string(retry.retry_cooldown), error);
  result.add_attribute("action", "retry_scheduled")
      .add_attribute("retry_amounts", std::to_string(attempts));
}

void engine::finalize(conduit::storage::kv_store& store,
                      const conduit::host::env& environment,
                      const batch_location& location,
                      const execution_result_t& outcome,
                      conduit::host::response& result) {
  auto execution_id = location.batch.execution_id;
  lane(location.priority).remove_at(store, location.position);
  kRetries.remove(store, execution_id);
  kFunctionIndex.remove(store, execution_id);
  kPendingConfirmations.remove(store, execution_id);

  result.add_message(make_callback(store, environment, execution_id, outcome));
  spdlog::info("Execution {} finished: {}", execution_id, to_string(outcome));
  result.add_attribute("outcome", to_string(outcome));
}

cosmos_msg_t engine::make_callback(conduit::storage::kv_store& store,
                                   const conduit::host::env& environment,
                                   const execution_id_t execution_id,
                                   const execution_result_t& outcome) const {
  auto config = kConfig.load(store);
  if (std::holds_alternative<processor_domain_polytone_t>(
          config.processor_domain)) {
    kPendingCallbacks.save(
        store, execution_id,
        pending_bridge_callback_t{
            .execution_result = outcome,
            .bridge = bridge_state_t{.delivery = bridge_delivery_t::pending}});
  }
  auto encoder = encoder_t{};
  auto payload = encoder.encode(registry_execute_msg_t{permissionless_msg_t{
      processor_callback_t{.execution_id = execution_id,
                           .execution_result = outcome}}});
  return router::route_callback(config, environment.contract_address,
                                std::move(payload), execution_id);
}

std::size_t engine::expire_batches(conduit::storage::kv_store& store,
                                   const conduit::host::env& environment,
                                   conduit::host::response& result) {
  auto expired = std::size_t{0};
  for (const auto priority : {priority_t::high, priority_t::medium}) {
    auto batches = lane(priority).load(store);
    auto removed = std::size_t{0};
    for (auto position = std::size_t{0}; position < batches.size();
         ++position) {
      const auto& batch = batches[position];
      if (!batch.expiration_time ||
          environment.block.time < *batch.expiration_time) {
        continue;
      }
      auto executed =
          is_atomic(batch.subroutine)
              ? uint64_t{0}
              : kFunctionIndex.may_load(store, batch.execution_id).value_or(0);
      spdlog::info("{} expired after {} function(s)", describe(batch),
                   executed);
      finalize(store, environment,
               batch_location{.priority = priority,
                              .position = position - removed,
                              .batch = batch},
               result_expired_t{.executed_count = executed}, result);
      ++removed;
    }
    expired += removed;
  }
  return expired;
}

std::optional<engine::batch_location> engine::find_batch(
    const conduit::storage::kv_store& store,
    const execution_id_t execution_id) const {
  for (const auto priority : {priority_t::high, priority_t::medium}) {
    auto batches = lane(priority).load(store);
    for (auto position = std::size_t{0}; position < batches.size();
         ++position) {
      if (batches[position].execution_id == execution_id) {
        return batch_location{.priority = priority,
                              .position = position,
                              .batch = std::move(batches[position])};
      }
    }
  }
  return std::nullopt;
}

bool engine::is_authorization_module(const processor_config_t& config,
                                     const address_t& sender) const {
  return std::visit(
      overloaded{[&](const processor_domain_main_t&) {
                   return sender == config.authorization_contract;
                 },
                 [&](const processor_domain_polytone_t& polytone) {
                   return sender == polytone.polytone_proxy_address;
                 },
                 [](const processor_domain_hyperlane_t&) { return false; }},
      config.processor_domain);
}

uint64_t engine::next_reply_id(conduit::storage::kv_store& store) const {
  auto id = kNextReplyId.load(store);
  kNextReplyId.save(store, id + 1);
  return id;
}

conduit::schema::query_result_t engine::query(
    const conduit::storage::kv_store& store,
    const conduit::host::env&,
    const std::string_view path,
    const bytes_view_t& data) const {
  auto encoder = encoder_t{};
  if (path == "/config") {
    return encoded_value(path, kConfig.load(store));
  }
  if (path == "/owner") {
    return encoded_value(path, kOwner.load(store));
  }
  if (path == "/is_queue_empty") {
    return encoded_value(path, kHighQueue.empty(store) &&
                                   kMediumQueue.empty(store));
  }
  if (path == "/queue") {
    auto request = data.empty()
                       ? std::optional<queue_request_t>{queue_request_t{}}
                       : encoder.try_decode<queue_request_t>(data);
    if (!request) {
      return conduit::host::make_query_error(
          query_error_code::malformed_request, "invalid queue request",
          kProcessorCodespace);
    }
    const auto& queue = lane(request->priority);
    auto from = static_cast<std::size_t>(request->from.value_or(0));
    auto to = request->to ? static_cast<std::size_t>(*request->to)
                          : queue.size(store);
    return encoded_value(path, queue.range(store, from, to));
  }

  auto id = encoder.try_decode<execution_id_t>(data);
  auto missing = [&](const std::string_view what) {
    return conduit::host::make_query_error(
        query_error_code::not_found,
        fmt::format("no {} for execution {}", what, id.value_or(0)),
        kProcessorCodespace);
  };
  if (path == "/retry") {
    auto retry = id ? kRetries.may_load(store, *id) : std::nullopt;
    return retry ? encoded_value(path, *retry) : missing("retry");
  }
  if (path == "/pending_callback") {
    auto pending = id ? kPendingCallbacks.may_load(store, *id) : std::nullopt;
    return pending ? encoded_value(path, *pending)
                   : missing("pending callback");
  }
  if (path == "/pending_confirmation") {
    auto pending =
        id ? kPendingConfirmations.may_load(store, *id) : std::nullopt;
    return pending ? encoded_value(path, *pending)
                   : missing("pending confirmation");
  }
  return conduit::host::make_query_error(
      query_error_code::unknown_path,
      fmt::format("unsupported query path '{}'", path), kProcessorCodespace);
}

}  // namespace conduit::processor
