#include <conduit/authorization/registry.hpp>
#include <conduit/authorization/validation.hpp>
#include <conduit/router/router.hpp>
#include <conduit/schema/authorization_error_code.hpp>
#include <conduit/schema/bridge_error_code.hpp>
#include <conduit/schema/encoding/scale/encoder.hpp>
#include <conduit/schema/page_request.hpp>
#include <conduit/schema/processor_msg.hpp>
#include <conduit/storage/item.hpp>
#include <conduit/storage/map.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

using namespace conduit::schema;

namespace conduit::authorization {

namespace {

using encoder_t = conduit::schema::encoding::scale_encoder_t;

const auto kOwner = conduit::storage::item<address_t>{"owner"};
const auto kProcessor = conduit::storage::item<address_t>{"processor"};
const auto kNextExecutionId =
    conduit::storage::item<execution_id_t>{"next_execution_id"};
const auto kSubOwners = conduit::storage::map<std::string, bool>{"sub_owners"};
const auto kExternalDomains =
    conduit::storage::map<std::string, external_domain_t>{"external_domains"};
const auto kAuthorizations =
    conduit::storage::map<std::string, authorization_t>{"authorizations"};
const auto kCurrentExecutions =
    conduit::storage::map<std::string, uint64_t>{"current_executions"};
const auto kMints = conduit::storage::map<std::string, amount_t>{"mints"};
const auto kCallbacks =
    conduit::storage::map<uint64_t, processor_callback_info_t>{
        "processor_callbacks"};

conduit::host::response authorization_error(
    const authorization_error_code code,
    std::string log) {
  spdlog::warn("Authorization registry rejected call: {}", log);
  return conduit::host::make_error(code, kAuthorizationCodespace,
                                   std::move(log));
}

conduit::host::response authorization_error(const validation_error& error) {
  return authorization_error(error.code, error.message);
}

conduit::host::response bridge_error(const bridge_error_code code,
                                     std::string log) {
  spdlog::warn("Authorization registry rejected bridge call: {}", log);
  return conduit::host::make_error(code, kBridgeCodespace, std::move(log));
}

std::string mint_key(const std::string& label, const address_t& address) {
  return fmt::format("{}:{}{}", label.size(), label, address);
}

amount_t mint_balance(const conduit::storage::kv_store& store,
                      const std::string& label,
                      const address_t& address) {
  return kMints.may_load(store, mint_key(label, address)).value_or(0);
}

void add_mint(conduit::storage::kv_store& store,
              const std::string& label,
              const address_t& address,
              const amount_t& amount) {
  kMints.save(store, mint_key(label, address),
              mint_balance(store, label, address) + amount);
}

void mint_initial_allowances(conduit::storage::kv_store& store,
                             const authorization_t& authorization) {
  const auto* permissioned =
      std::get_if<mode_permissioned_t>(&authorization.mode);
  if (permissioned == nullptr) {
    return;
  }
  std::visit(overloaded{[&](const permission_with_call_limit_t& value) {
                          for (const auto& allowance : value.allowances) {
                            add_mint(store, authorization.label,
                                     allowance.address, allowance.amount);
                          }
                        },
                        [&](const permission_without_call_limit_t& value) {
                          for (const auto& address : value.addresses) {
                            add_mint(store, authorization.label, address, 1);
                          }
                        }},
             permissioned->permission);
}

std::optional<external_domain_t> find_domain_by_note(
    const conduit::storage::kv_store& store,
    const address_t& note) {
  for (auto& [name, domain] : kExternalDomains.entries(store)) {
    const auto* polytone = polytone_of(domain);
    if (polytone != nullptr && polytone->note.address == note) {
      return std::move(domain);
    }
  }
  return std::nullopt;
}

std::optional<external_domain_t> find_domain_by_mailbox(
    const conduit::storage::kv_store& store,
    const address_t& mailbox,
    const uint32_t origin) {
  for (auto& [name, domain] : kExternalDomains.entries(store)) {
    const auto* hyperlane = hyperlane_of(domain);
    if (hyperlane != nullptr && hyperlane->mailbox == mailbox &&
        hyperlane->domain_id == origin) {
      return std::move(domain);
    }
  }
  return std::nullopt;
}

/// Sender allowed to report results for batches sent to `domain`.
address_t callback_address_for(const conduit::storage::kv_store& store,
                               const domain_t& domain) {
  return std::visit(
      overloaded{[&](const domain_main_t&) { return kProcessor.load(store); },
                 [&](const domain_external_t& value) {
                   auto external = kExternalDomains.may_load(store, value.name);
                   if (!external) {
                     return address_t{};
                   }
                   const auto* polytone = polytone_of(*external);
                   return polytone != nullptr ? polytone->proxy
                                              : external->processor;
                 }},
      domain);
}

bridge_delivery_t initial_delivery(const conduit::storage::kv_store& store,
                                   const domain_t& domain) {
  const auto* external = std::get_if<domain_external_t>(&domain);
  if (external == nullptr) {
    return bridge_delivery_t::none;
  }
  auto registered = kExternalDomains.may_load(store, external->name);
  if (registered && polytone_of(*registered) != nullptr) {
    return bridge_delivery_t::pending;
  }
  return bridge_delivery_t::none;
}

external_domain_t make_external_domain(const external_domain_info_t& info) {
  auto environment = std::visit(
      overloaded{[](const polytone_connectors_info_t& value)
                     -> execution_environment_t {
                   return cosmwasm_environment_t{
                       .polytone = polytone_connectors_t{
                           .note = polytone_note_t{
                               .address = value.note.address,
                               .timeout_seconds = value.note.timeout_seconds},
                           .proxy = value.proxy}};
                 },
                 [](const evm_environment_t& value) -> execution_environment_t {
                   return value;
                 }},
      info.execution_environment);
  return external_domain_t{.name = info.name,
                           .execution_environment = std::move(environment),
                           .processor = info.processor};
}

std::optional<timestamp_seconds_t> batch_expiration(
    const subroutine_t& subroutine,
    const block_info_t& block) {
  auto relative = expiration_time_of(subroutine);
  if (!relative) {
    return std::nullopt;
  }
  return block.time + *relative;
}

template <typename T>
conduit::schema::query_result_t encoded_value(const std::string_view path,
                                              const T& value) {
  auto encoder = encoder_t{};
  return conduit::host::make_query_value(make_bytes(path),
                                         encoder.encode(value));
}

template <typename Request>
std::optional<Request> decode_request(const bytes_view_t& data) {
  if (data.empty()) {
    return Request{};
  }
  auto encoder = encoder_t{};
  return encoder.try_decode<Request>(data);
}

conduit::schema::query_result_t invalid_query(const std::string_view path) {
  return conduit::host::make_query_error(
      query_error_code::malformed_request,
      fmt::format("invalid request for '{}'", path), kAuthorizationCodespace);
}

}  // namespace

conduit::host::response registry::instantiate(
    conduit::storage::kv_store& store,
    const conduit::host::env& environment,
    const conduit::host::message_info&,
    const bytes_view_t& msg) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<registry_instantiate_t>(msg);
  if (!decoded) {
    return authorization_error(authorization_error_code::invalid_message,
                               "invalid instantiate message");
  }
  kOwner.save(store, decoded->owner);
  kProcessor.save(store, decoded->processor);
  kNextExecutionId.save(store, 1);
  for (const auto& sub_owner : decoded->sub_owners) {
    kSubOwners.save(store, sub_owner, true);
  }
  spdlog::info("Authorization registry {} instantiated; owner {}, processor {}",
               environment.contract_address, decoded->owner,
               decoded->processor);
  auto result = conduit::host::response{};
  result.add_attribute("method", "instantiate")
      .add_attribute("owner", decoded->owner)
      .add_attribute("processor", decoded->processor);
  return result;
}

conduit::host::response registry::execute(
    conduit::storage::kv_store& store,
    const conduit::host::env& environment,
    const conduit::host::message_info& info,
    const bytes_view_t& msg) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<registry_execute_msg_t>(msg);
  if (!decoded) {
    return authorization_error(authorization_error_code::invalid_message,
                               "failed to decode registry message");
  }
  return std::visit(
      overloaded{
          [&](const owner_msg_t& value) {
            return execute_owner(store, info, value);
          },
          [&](const permissioned_msg_t& value) {
            if (!is_permissioned(store, info.sender)) {
              return authorization_error(
                  authorization_error_code::unauthorized,
                  fmt::format("{} is neither owner nor sub-owner",
                              info.sender));
            }
            return execute_permissioned(store, environment, info, value);
          },
          [&](const permissionless_msg_t& value) {
            return execute_permissionless(store, environment, info, value);
          },
          [&](const polytone_callback_message_t& value) {
            return polytone_callback(store, environment, info, value);
          },
          [&](const hyperlane_handle_t& value) {
            return hyperlane_callback(store, info, value);
          }},
      *decoded);
}

conduit::host::response registry::execute_owner(
    conduit::storage::kv_store& store,
    const conduit::host::message_info& info,
    const owner_msg_t& msg) {
  if (!is_owner(store, info.sender)) {
    return authorization_error(authorization_error_code::unauthorized,
                               fmt::format("{} is not the owner", info.sender));
  }
  auto result = conduit::host::response{};
  std::visit(overloaded{[&](const add_sub_owner_t& value) {
                          kSubOwners.save(store, value.sub_owner, true);
                          result.add_attribute("method", "add_sub_owner")
                              .add_attribute("sub_owner", value.sub_owner);
                        },
                        [&](const remove_sub_owner_t& value) {
                          kSubOwners.remove(store, value.sub_owner);
                          result.add_attribute("method", "remove_sub_owner")
                              .add_attribute("sub_owner", value.sub_owner);
                        }},
             msg);
  return result;
}

conduit::host::response registry::execute_permissioned(
    conduit::storage::kv_store& store,
    const conduit::host::env& environment,
    const conduit::host::message_info& info,
    const permissioned_msg_t& msg) {
  auto encoder = encoder_t{};
  return std::visit(
      overloaded{
          [&](const add_external_domains_t& value) {
            return add_external_domains(store, environment, value);
          },
          [&](const create_authorizations_t& value) {
            return create_authorizations(store, environment, value);
          },
          [&](const modify_authorization_t& value) {
            return modify_authorization(store, value);
          },
          [&](const disable_authorization_t& value) {
            return set_authorization_state(store, value.label,
                                           authorization_state_t::disabled);
          },
          [&](const enable_authorization_t& value) {
            return set_authorization_state(store, value.label,
                                           authorization_state_t::enabled);
          },
          [&](const mint_authorizations_t& value) {
            return mint_authorizations(store, value);
          },
          [&](const remove_msgs_t& value) {
            auto payload = encoder.encode(processor_execute_msg_t{
                authorization_module_msg_t{evict_msgs_t{
                    .queue_position = value.queue_position,
                    .priority = value.priority}}});
            return forward_to_processor(store, environment, value.domain,
                                        payload, "remove_msgs");
          },
          [&](const add_msgs_t& value) {
            return add_msgs(store, environment, info, value);
          },
          [&](const pause_processor_t& value) {
            auto payload = encoder.encode(
                processor_execute_msg_t{authorization_module_msg_t{pause_t{}}});
            return forward_to_processor(store, environment, value.domain,
                                        payload, "pause_processor");
          },
          [&](const resume_processor_t& value) {
            auto payload = encoder.encode(processor_execute_msg_t{
                authorization_module_msg_t{resume_t{}}});
            return forward_to_processor(store, environment, value.domain,
                                        payload, "resume_processor");
          }},
      msg);
}

conduit::host::response registry::execute_permissionless(
    conduit::storage::kv_store& store,
    const conduit::host::env& environment,
    const conduit::host::message_info& info,
    const permissionless_msg_t& msg) {
  return std::visit(
      overloaded{[&](const send_msgs_t& value) {
                   return send_msgs(store, environment, info, value);
                 },
                 [&](const processor_callback_t& value) {
                   return processor_callback(store, info.sender, value);
                 },
                 [&](const retry_msgs_t& value) {
                   return retry_msgs(store, environment, value);
                 },
                 [&](const retry_bridge_creation_t& value) {
                   return retry_bridge_creation(store, environment, value);
                 }},
      msg);
}

conduit::host::response registry::add_external_domains(
    conduit::storage::kv_store& store,
    const conduit::host::env& environment,
    const add_external_domains_t& msg) {
  auto result = conduit::host::response{};
  result.add_attribute("method", "add_external_domains");
  for (const auto& info : msg.external_domains) {
    if (kExternalDomains.has(store, info.name)) {
      return authorization_error(
          authorization_error_code::domain_already_exists,
          fmt::format("external domain '{}' already exists", info.name));
    }
    auto domain = make_external_domain(info);
    kExternalDomains.save(store, domain.name, domain);
    if (const auto* polytone = polytone_of(domain); polytone != nullptr) {
      result.add_message(router::create_proxy_message(
          polytone->note.address, polytone->note.timeout_seconds,
          environment.contract_address,
          polytone_tag_create_proxy_t{.domain_name = domain.name}));
    }
    spdlog::info("Registered external domain '{}' with processor {}",
                 domain.name, domain.processor);
    result.add_attribute("domain", domain.name);
  }
  return result;
}

conduit::host::response registry::create_authorizations(
    conduit::storage::kv_store& store,
    const conduit::host::env& environment,
    const create_authorizations_t& msg) {
  auto result = conduit::host::response{};
  result.add_attribute("method", "create_authorizations");
  for (const auto& info : msg.authorizations) {
    if (auto error = validate_authorization_info(info)) {
      return authorization_error(*error);
    }
    if (kAuthorizations.has(store, info.label)) {
      return authorization_error(
          authorization_error_code::label_already_exists,
          fmt::format("authorization '{}' already exists", info.label));
    }
    auto environment_of_domain = std::optional<execution_environment_t>{};
    const auto& domain = function_domain(info.subroutine, 0);
    if (const auto* external = std::get_if<domain_external_t>(&domain)) {
      auto registered = kExternalDomains.may_load(store, external->name);
      if (!registered) {
        return authorization_error(
            authorization_error_code::domain_not_registered,
            fmt::format("domain '{}' is not registered", external->name));
      }
      environment_of_domain = registered->execution_environment;
    }
    if (auto error = validate_environment(info.subroutine,
                                          environment_of_domain)) {
      return authorization_error(*error);
    }

    auto authorization = make_authorization(info, environment.block);
    kAuthorizations.save(store, authorization.label, authorization);
    mint_initial_allowances(store, authorization);
    spdlog::info("Created authorization '{}' on {} ({} functions)",
                 authorization.label, to_string(domain),
                 function_count(authorization.subroutine));
    result.add_attribute("label", authorization.label);
  }
  return result;
}

conduit::host::response registry::modify_authorization(
    conduit::storage::kv_store& store,
    const modify_authorization_t& msg) {
  auto authorization = kAuthorizations.may_load(store, msg.label);
  if (!authorization) {
    return authorization_error(
        authorization_error_code::authorization_not_found,
        fmt::format("authorization '{}' not found", msg.label));
  }
  if (msg.not_before) {
    authorization->not_before = *msg.not_before;
  }
  if (msg.expiration) {
    authorization->expiration = *msg.expiration;
  }
  if (msg.max_concurrent_executions) {
    if (*msg.max_concurrent_executions == 0) {
      return authorization_error(
          authorization_error_code::invalid_max_concurrent_executions,
          "max_concurrent_executions must be positive");
    }
    authorization->max_concurrent_executions = *msg.max_concurrent_executions;
  }
  if (msg.priority) {
    if (is_permissionless(authorization->mode) &&
        *msg.priority == priority_t::high) {
      return authorization_error(
          authorization_error_code::permissionless_with_high_priority,
          fmt::format(
              "permissionless authorization '{}' cannot be high priority",
              msg.label));
    }
    authorization->priority = *msg.priority;
  }
  kAuthorizations.save(store, msg.label, *authorization);
  auto result = conduit::host::response{};
  result.add_attribute("method", "modify_authorization")
      .add_attribute("label", msg.label);
  return result;
}

conduit::host::response registry::set_authorization_state(
    conduit::storage::kv_store& store,
    const std::string& label,
    const authorization_state_t state) {
  auto authorization = kAuthorizations.may_load(store, label);
  if (!authorization) {
    return authorization_error(
        authorization_error_code::authorization_not_found,
        fmt::format("authorization '{}' not found", label));
  }
  authorization->state = state;
  kAuthorizations.save(store, label, *authorization);
  spdlog::info("Authorization '{}' is now {}", label, to_string(state));
  auto result = conduit::host::response{};
  result
      .add_attribute("method", state == authorization_state_t::enabled
                                   ? "enable_authorization"
                                   : "disable_authorization")
      .add_attribute("label", label);
  return result;
}

conduit::host::response registry::mint_authorizations(
    conduit::storage::kv_store& store,
    const mint_authorizations_t& msg) {
  auto authorization = kAuthorizations.may_load(store, msg.label);
  if (!authorization) {
    return authorization_error(
        authorization_error_code::authorization_not_found,
        fmt::format("authorization '{}' not found", msg.label));
  }
  if (is_permissionless(authorization->mode)) {
    return authorization_error(
        authorization_error_code::cannot_mint_permissionless,
        fmt::format("authorization '{}' is permissionless", msg.label));
  }
  for (const auto& mint : msg.mints) {
    add_mint(store, msg.label, mint.address, mint.amount);
  }
  auto result = conduit::host::response{};
  result.add_attribute("method", "mint_authorizations")
      .add_attribute("label", msg.label);
  return result;
}

conduit::host::response registry::add_msgs(
    conduit::storage::kv_store& store,
    const conduit::host::env& environment,
    const conduit::host::message_info& info,
    const add_msgs_t& msg) {
  auto authorization = kAuthorizations.may_load(store, msg.label);
  if (!authorization) {
    return authorization_error(
        authorization_error_code::authorization_not_found,
        fmt::format("authorization '{}' not found", msg.label));
  }
  if (auto error = validate_messages(authorization->subroutine, msg.messages)) {
    return authorization_error(*error);
  }

  const auto& domain = target_domain(*authorization);
  auto execution_id = next_execution_id(store);
  auto encoder = encoder_t{};
  auto payload = encoder.encode(processor_execute_msg_t{
      authorization_module_msg_t{insert_msgs_t{
          .execution_id = execution_id,
          .queue_position = msg.queue_position,
          .msgs = msg.messages,
          .subroutine = authorization->subroutine,
          .priority = msg.priority,
          .expiration_time =
              batch_expiration(authorization->subroutine, environment.block)}}});

  auto result = conduit::host::response{};
  if (auto error = route(store, environment, domain, payload, execution_id,
                         result)) {
    return std::move(*error);
  }
  kCallbacks.save(
      store, execution_id,
      processor_callback_info_t{
          .execution_id = execution_id,
          .label = msg.label,
          .initiator = info.sender,
          .domain = domain,
          .processor_callback_address = callback_address_for(store, domain),
          .messages = msg.messages,
          .execution_result = result_in_process_t{},
          .bridge = bridge_state_t{.delivery = initial_delivery(store, domain)},
          .dispatch_payload = std::move(payload),
          .created_at_height = environment.block.height,
          .created_at_time = environment.block.time});
  result.data = encoder.encode(execution_id);
  result.add_attribute("method", "add_msgs")
      .add_attribute("label", msg.label)
      .add_attribute("execution_id", std::to_string(execution_id));
  return result;
}

conduit::host::response registry::forward_to_processor(
    const conduit::storage::kv_store& store,
    const conduit::host::env& environment,
    const domain_t& domain,
    const bytes_t& payload,
    const std::string_view action) {
  auto result = conduit::host::response{};
  if (auto error =
          route(store, environment, domain, payload, std::nullopt, result)) {
    return std::move(*error);
  }
  result.add_attribute("method", std::string{action})
      .add_attribute("domain", to_string(domain));
  return result;
}

conduit::host::response registry::send_msgs(
    conduit::storage::kv_store& store,
    const conduit::host::env& environment,
    const conduit::host::message_info& info,
    const send_msgs_t& msg) {
  auto authorization = kAuthorizations.may_load(store, msg.label);
  if (!authorization) {
    return authorization_error(
        authorization_error_code::authorization_not_found,
        fmt::format("authorization '{}' not found", msg.label));
  }
  if (authorization->state == authorization_state_t::disabled) {
    return authorization_error(
        authorization_error_code::authorization_disabled,
        fmt::format("authorization '{}' is disabled", msg.label));
  }
  if (!std::holds_alternative<expiration_never_t>(authorization->not_before) &&
      !is_expired(authorization->not_before, environment.block)) {
    return authorization_error(
        authorization_error_code::authorization_not_active_yet,
        fmt::format("authorization '{}' is not active until {}", msg.label,
                    to_string(authorization->not_before)));
  }
  if (is_expired(authorization->expiration, environment.block)) {
    return authorization_error(
        authorization_error_code::authorization_expired,
        fmt::format("authorization '{}' expired at {}", msg.label,
                    to_string(authorization->expiration)));
  }

  auto escrowed_mint = false;
  if (const auto* permissioned =
          std::get_if<mode_permissioned_t>(&authorization->mode)) {
    auto balance = mint_balance(store, msg.label, info.sender);
    if (balance == 0) {
      return authorization_error(
          authorization_error_code::not_allowed,
          fmt::format("{} may not call '{}'", info.sender, msg.label));
    }
    if (std::holds_alternative<permission_with_call_limit_t>(
            permissioned->permission)) {
      kMints.save(store, mint_key(msg.label, info.sender), balance - 1);
      escrowed_mint = true;
    }
  }

  auto current = kCurrentExecutions.may_load(store, msg.label).value_or(0);
  if (current >= authorization->max_concurrent_executions) {
    return authorization_error(
        authorization_error_code::concurrency_limit_reached,
        fmt::format("authorization '{}' already runs {} execution(s)",
                    msg.label, current));
  }
  if (auto error = validate_messages(authorization->subroutine, msg.messages)) {
    return authorization_error(*error);
  }

  const auto& domain = target_domain(*authorization);
  auto execution_id = next_execution_id(store);
  auto encoder = encoder_t{};
  auto payload = encoder.encode(processor_execute_msg_t{
      authorization_module_msg_t{enqueue_msgs_t{
          .execution_id = execution_id,
          .msgs = msg.messages,
          .subroutine = authorization->subroutine,
          .priority = authorization->priority,
          .expiration_time =
              batch_expiration(authorization->subroutine, environment.block)}}});

  auto result = conduit::host::response{};
  if (auto error = route(store, environment, domain, payload, execution_id,
                         result)) {
    return std::move(*error);
  }
  kCurrentExecutions.save(store, msg.label, current + 1);
  kCallbacks.save(
      store, execution_id,
      processor_callback_info_t{
          .execution_id = execution_id,
          .label = msg.label,
          .initiator = info.sender,
          .domain = domain,
          .processor_callback_address = callback_address_for(store, domain),
          .messages = msg.messages,
          .ttl = msg.ttl,
          .execution_result = result_in_process_t{},
          .bridge = bridge_state_t{.delivery = initial_delivery(store, domain)},
          .dispatch_payload = std::move(payload),
          .escrowed_mint = escrowed_mint,
          .holds_concurrency_slot = true,
          .created_at_height = environment.block.height,
          .created_at_time = environment.block.time});

  spdlog::info("Sent '{}' as execution {} to {}", msg.label, execution_id,
               to_string(domain));
  result.data = encoder.encode(execution_id);
  result.add_attribute("method", "send_msgs")
      .add_attribute("label", msg.label)
      .add_attribute("execution_id", std::to_string(execution_id));
  return result;
}

conduit::host::response registry::processor_callback(
    conduit::storage::kv_store& store,
    const address_t& sender,
    const processor_callback_t& msg) {
  auto callback = kCallbacks.may_load(store, msg.execution_id);
  if (!callback) {
    return authorization_error(
        authorization_error_code::callback_not_found,
        fmt::format("no execution {}", msg.execution_id));
  }
  if (sender != callback->processor_callback_address) {
    return authorization_error(
        authorization_error_code::unauthorized_callback_sender,
        fmt::format("{} may not report execution {}", sender,
                    msg.execution_id));
  }

  auto result = conduit::host::response{};
  result.add_attribute("method", "processor_callback")
      .add_attribute("execution_id", std::to_string(msg.execution_id));
  if (!std::holds_alternative<result_in_process_t>(
          callback->execution_result)) {
    spdlog::debug("Execution {} already settled as {}; ignoring {}",
                  msg.execution_id, to_string(callback->execution_result),
                  to_string(msg.execution_result));
    result.add_attribute("outcome", "already_settled");
    return result;
  }

  callback->execution_result = msg.execution_result;
  if (is_terminal(callback->execution_result)) {
    settle(store, *callback);
  }
  kCallbacks.save(store, msg.execution_id, *callback);
  spdlog::info("Execution {} of '{}' finished: {}", msg.execution_id,
               callback->label, to_string(callback->execution_result));
  result.add_attribute("outcome", to_string(callback->execution_result));
  return result;
}

conduit::host::response registry::retry_msgs(
    conduit::storage::kv_store& store,
    const conduit::host::env& environment,
    const retry_msgs_t& msg) {
  auto callback = kCallbacks.may_load(store, msg.execution_id);
  if (!callback) {
    return authorization_error(
        authorization_error_code::callback_not_found,
        fmt::format("no execution {}", msg.execution_id));
  }
  const auto* timeout = std::get_if<result_timeout_t>(&callback->execution_result);
  if (timeout == nullptr || !timeout->retriable) {
    return authorization_error(
        authorization_error_code::retry_not_allowed,
        fmt::format("execution {} is {}", msg.execution_id,
                    to_string(callback->execution_result)));
  }

  auto result = conduit::host::response{};
  result.add_attribute("method", "retry_msgs")
      .add_attribute("execution_id", std::to_string(msg.execution_id));
  if (callback->ttl && is_expired(*callback->ttl, environment.block)) {
    callback->execution_result = result_timeout_t{.retriable = false};
    settle(store, *callback);
    kCallbacks.save(store, msg.execution_id, *callback);
    result.add_attribute("outcome", "ttl_expired");
    return result;
  }

  if (auto error = route(store, environment, callback->domain,
                         callback->dispatch_payload, msg.execution_id,
                         result)) {
    return std::move(*error);
  }
  callback->execution_result = result_in_process_t{};
  callback->bridge = bridge_state_t{.delivery = bridge_delivery_t::pending};
  kCallbacks.save(store, msg.execution_id, *callback);
  spdlog::info("Resent execution {} to {}", msg.execution_id,
               to_string(callback->domain));
  result.add_attribute("outcome", "resent");
  return result;
}

conduit::host::response registry::retry_bridge_creation(
    conduit::storage::kv_store& store,
    const conduit::host::env& environment,
    const retry_bridge_creation_t& msg) {
  auto domain = kExternalDomains.may_load(store, msg.domain_name);
  if (!domain) {
    return authorization_error(
        authorization_error_code::domain_not_registered,
        fmt::format("domain '{}' is not registered", msg.domain_name));
  }
  auto* polytone = polytone_of(*domain);
  if (polytone == nullptr) {
    return bridge_error(
        bridge_error_code::unsupported_environment,
        fmt::format("domain '{}' is not bridged through Polytone",
                    msg.domain_name));
  }
  if (polytone->note.state.status != polytone_proxy_status_t::timed_out) {
    return authorization_error(
        authorization_error_code::retry_not_allowed,
        fmt::format("proxy for '{}' is {}", msg.domain_name,
                    to_string(polytone->note.state.status)));
  }
  polytone->note.state = polytone_proxy_state_t{};
  kExternalDomains.save(store, msg.domain_name, *domain);

  auto result = conduit::host::response{};
  result.add_message(router::create_proxy_message(
      polytone->note.address, polytone->note.timeout_seconds,
      environment.contract_address,
      polytone_tag_create_proxy_t{.domain_name = msg.domain_name}));
  result.add_attribute("method", "retry_bridge_creation")
      .add_attribute("domain", msg.domain_name);
  return result;
}

conduit::host::response registry::polytone_callback(
    conduit::storage::kv_store& store,
    const conduit::host::env& environment,
    const conduit::host::message_info& info,
    const polytone_callback_message_t& msg) {
  if (msg.initiator != environment.contract_address) {
    return bridge_error(
        bridge_error_code::invalid_initiator,
        fmt::format("callback initiated by {}", msg.initiator));
  }
  auto domain = find_domain_by_note(store, info.sender);
  if (!domain) {
    return bridge_error(
        bridge_error_code::unknown_bridge_sender,
        fmt::format("{} is not a registered Polytone note", info.sender));
  }
  auto tag = router::decode_tag(msg.initiator_msg);
  if (!tag) {
    return authorization_error(authorization_error_code::invalid_callback_body,
                               "unrecognised Polytone callback tag");
  }

  auto result = conduit::host::response{};
  result.add_attribute("method", "polytone_callback");
  auto error = std::visit(
      overloaded{
          [&](const polytone_tag_create_proxy_t& value)
              -> std::optional<conduit::host::response> {
            if (value.domain_name != domain->name) {
              return authorization_error(
                  authorization_error_code::invalid_callback_body,
                  fmt::format("note of '{}' reported proxy for '{}'",
                              domain->name, value.domain_name));
            }
            auto* polytone = polytone_of(*domain);
            polytone->note.state = router::next_proxy_state(msg.result);
            kExternalDomains.save(store, domain->name, *domain);
            spdlog::info("Proxy for domain '{}' is {}", domain->name,
                         to_string(polytone->note.state.status));
            result.add_attribute("domain", domain->name)
                .add_attribute("proxy_state",
                               std::string{
                                   to_string(polytone->note.state.status)});
            return std::nullopt;
          },
          [&](const polytone_tag_execution_id_t& value)
              -> std::optional<conduit::host::response> {
            auto callback = kCallbacks.may_load(store, value.execution_id);
            if (!callback) {
              return authorization_error(
                  authorization_error_code::callback_not_found,
                  fmt::format("no execution {}", value.execution_id));
            }
            callback->bridge = router::bridge_state_of(msg.result);
            if (callback->bridge.delivery != bridge_delivery_t::delivered &&
                std::holds_alternative<result_in_process_t>(
                    callback->execution_result)) {
              if (callback->bridge.delivery == bridge_delivery_t::timed_out) {
                callback->execution_result = result_timeout_t{
                    .retriable =
                        !callback->ttl ||
                        !is_expired(*callback->ttl, environment.block)};
              } else {
                callback->execution_result =
                    result_unexpected_error_t{.error = callback->bridge.error};
              }
              if (is_terminal(callback->execution_result)) {
                settle(store, *callback);
              }
            }
            kCallbacks.save(store, value.execution_id, *callback);
            result.add_attribute("execution_id",
                                 std::to_string(value.execution_id))
                .add_attribute("delivery",
                               std::string{to_string(callback->bridge.delivery)});
            return std::nullopt;
          }},
      *tag);
  if (error) {
    return std::move(*error);
  }
  return result;
}

conduit::host::response registry::hyperlane_callback(
    conduit::storage::kv_store& store,
    const conduit::host::message_info& info,
    const hyperlane_handle_t& msg) {
  auto domain = find_domain_by_mailbox(store, info.sender, msg.origin);
  if (!domain) {
    return bridge_error(
        bridge_error_code::unknown_bridge_sender,
        fmt::format("{} is not the mailbox of domain id {}", info.sender,
                    msg.origin));
  }
  if (msg.sender != domain->processor) {
    return bridge_error(
        bridge_error_code::unknown_bridge_sender,
        fmt::format("{} is not the processor of '{}'", msg.sender,
                    domain->name));
  }
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<registry_execute_msg_t>(msg.body);
  const auto* permissionless =
      decoded ? std::get_if<permissionless_msg_t>(&*decoded) : nullptr;
  const auto* callback =
      permissionless ? std::get_if<processor_callback_t>(permissionless)
                     : nullptr;
  if (callback == nullptr) {
    return authorization_error(authorization_error_code::invalid_callback_body,
                               "mailbox body is not a processor callback");
  }
  return processor_callback(store, msg.sender, *callback);
}

std::optional<conduit::host::response> registry::route(
    const conduit::storage::kv_store& store,
    const conduit::host::env& environment,
    const domain_t& domain,
    bytes_t payload,
    const std::optional<execution_id_t>& execution_id,
    conduit::host::response& result) const {
  return std::visit(
      overloaded{
          [&](const domain_main_t&) -> std::optional<conduit::host::response> {
            result.add_message(
                router::route_to_main(kProcessor.load(store), std::move(payload)));
            return std::nullopt;
          },
          [&](const domain_external_t& value)
              -> std::optional<conduit::host::response> {
            auto external = kExternalDomains.may_load(store, value.name);
            if (!external) {
              return authorization_error(
                  authorization_error_code::domain_not_registered,
                  fmt::format("domain '{}' is not registered", value.name));
            }
            const auto* polytone = polytone_of(*external);
            if (polytone != nullptr &&
                polytone->note.state.status !=
                    polytone_proxy_status_t::created) {
              return bridge_error(
                  bridge_error_code::proxy_not_created,
                  fmt::format("proxy for domain '{}' is {}", value.name,
                              to_string(polytone->note.state.status)));
            }
            result.add_message(router::route_to_external(
                *external, std::move(payload), environment.contract_address,
                execution_id));
            return std::nullopt;
          }},
      domain);
}

void registry::settle(conduit::storage::kv_store& store,
                      processor_callback_info_t& callback) const {
  if (callback.holds_concurrency_slot) {
    auto current =
        kCurrentExecutions.may_load(store, callback.label).value_or(0);
    kCurrentExecutions.save(store, callback.label,
                            current > 0 ? current - 1 : 0);
    callback.holds_concurrency_slot = false;
  }
  if (callback.escrowed_mint) {
    if (is_nothing_executed(callback.execution_result)) {
      add_mint(store, callback.label, callback.initiator, 1);
      spdlog::debug("Refunded call of '{}' to {}", callback.label,
                    callback.initiator);
    }
    callback.escrowed_mint = false;
  }
}

execution_id_t registry::next_execution_id(
    conduit::storage::kv_store& store) const {
  auto id = kNextExecutionId.load(store);
  kNextExecutionId.save(store, id + 1);
  return id;
}

bool registry::is_owner(const conduit::storage::kv_store& store,
                        const address_t& address) const {
  return kOwner.load(store) == address;
}

bool registry::is_permissioned(const conduit::storage::kv_store& store,
                               const address_t& address) const {
  return is_owner(store, address) || kSubOwners.has(store, address);
}

conduit::schema::query_result_t registry::query(
    const conduit::storage::kv_store& store,
    const conduit::host::env&,
    const std::string_view path,
    const bytes_view_t& data) const {
  auto encoder = encoder_t{};
  if (path == "/owner") {
    return encoded_value(path, kOwner.load(store));
  }
  if (path == "/processor") {
    return encoded_value(path, kProcessor.load(store));
  }
  if (path == "/sub_owners") {
    auto sub_owners = std::vector<address_t>{};
    for (auto& [address, ignored] : kSubOwners.entries(store)) {
      sub_owners.push_back(address);
    }
    return encoded_value(path, sub_owners);
  }
  if (path == "/external_domains") {
    auto request = decode_request<page_request_t>(data);
    if (!request) {
      return invalid_query(path);
    }
    auto domains = std::vector<external_domain_t>{};
    for (auto& [name, domain] : kExternalDomains.range(
             store, request->start_after, page_limit(request->limit))) {
      domains.push_back(std::move(domain));
    }
    return encoded_value(path, domains);
  }
  if (path == "/external_domain") {
    auto name = make_string(data);
    auto domain = kExternalDomains.may_load(store, name);
    if (!domain) {
      return conduit::host::make_query_error(
          query_error_code::not_found,
          fmt::format("domain '{}' not found", name), kAuthorizationCodespace);
    }
    return encoded_value(path, *domain);
  }
  if (path == "/authorizations") {
    auto request = decode_request<page_request_t>(data);
    if (!request) {
      return invalid_query(path);
    }
    auto authorizations = std::vector<authorization_t>{};
    for (auto& [label, authorization] : kAuthorizations.range(
             store, request->start_after, page_limit(request->limit))) {
      authorizations.push_back(std::move(authorization));
    }
    return encoded_value(path, authorizations);
  }
  if (path == "/processor_callbacks") {
    auto request = decode_request<id_page_request_t>(data);
    if (!request) {
      return invalid_query(path);
    }
    auto callbacks = std::vector<processor_callback_info_t>{};
    for (auto& [id, callback] : kCallbacks.range(
             store, request->start_after, page_limit(request->limit))) {
      callbacks.push_back(std::move(callback));
    }
    return encoded_value(path, callbacks);
  }
  if (path == "/processor_callback") {
    auto id = encoder.try_decode<execution_id_t>(data);
    if (!id) {
      return invalid_query(path);
    }
    auto callback = kCallbacks.may_load(store, *id);
    if (!callback) {
      return conduit::host::make_query_error(
          query_error_code::not_found, fmt::format("no execution {}", *id),
          kAuthorizationCodespace);
    }
    return encoded_value(path, *callback);
  }
  if (path == "/mint_balance") {
    auto request = encoder.try_decode<mint_balance_request_t>(data);
    if (!request) {
      return invalid_query(path);
    }
    return encoded_value(
        path, mint_balance(store, request->label, request->address));
  }
  if (path == "/current_executions") {
    auto label = make_string(data);
    return encoded_value(
        path, kCurrentExecutions.may_load(store, label).value_or(0));
  }
  return conduit::host::make_query_error(
      query_error_code::unknown_path,
      fmt::format("unsupported query path '{}'", path),
      kAuthorizationCodespace);
}

}  // namespace conduit::authorization
