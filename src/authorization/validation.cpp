#include <conduit/authorization/validation.hpp>
#include <conduit/router/router.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

namespace conduit::authorization {

namespace {

using conduit::schema::authorization_error_code;

validation_error make_validation_error(const authorization_error_code code,
                                       std::string message) {
  return validation_error{.code = code, .message = std::move(message)};
}

/// Node the path resolves to, or nullptr when any segment is missing.
const nlohmann::json* resolve(const nlohmann::json& root,
                              const conduit::schema::json_path_t& path) {
  const auto* node = &root;
  for (const auto& segment : path) {
    if (!node->is_object()) {
      return nullptr;
    }
    auto it = node->find(segment);
    if (it == node->end()) {
      return nullptr;
    }
    node = &*it;
  }
  return node;
}

std::string join_path(const conduit::schema::json_path_t& path) {
  return fmt::format("{}", fmt::join(path, "."));
}

std::optional<validation_error> check_restriction(
    const nlohmann::json& root,
    const conduit::schema::param_restriction_t& restriction) {
  return std::visit(
      overloaded{
          [&](const conduit::schema::must_be_included_t& value)
              -> std::optional<validation_error> {
            if (resolve(root, value.path) == nullptr) {
              return make_validation_error(
                  authorization_error_code::invalid_message_params,
                  fmt::format("'{}' must be included", join_path(value.path)));
            }
            return std::nullopt;
          },
          [&](const conduit::schema::cannot_be_included_t& value)
              -> std::optional<validation_error> {
            if (resolve(root, value.path) != nullptr) {
              return make_validation_error(
                  authorization_error_code::invalid_message_params,
                  fmt::format("'{}' cannot be included",
                              join_path(value.path)));
            }
            return std::nullopt;
          },
          [&](const conduit::schema::must_be_value_t& value)
              -> std::optional<validation_error> {
            const auto* node = resolve(root, value.path);
            auto expected = nlohmann::json::parse(
                std::begin(value.value), std::end(value.value), nullptr, false);
            if (node == nullptr || expected.is_discarded() ||
                *node != expected) {
              return make_validation_error(
                  authorization_error_code::invalid_message_params,
                  fmt::format("'{}' must be {}", join_path(value.path),
                              conduit::schema::make_string(value.value)));
            }
            return std::nullopt;
          }},
      restriction);
}

bool uses_json_body(const conduit::schema::message_type_t type) {
  return type != conduit::schema::message_type_t::evm_raw_call;
}

}  // namespace

std::optional<validation_error> validate_authorization_info(
    const conduit::schema::authorization_info_t& info) {
  if (info.label.empty()) {
    return make_validation_error(authorization_error_code::empty_label,
                                 "authorization label cannot be empty");
  }
  auto count = conduit::schema::function_count(info.subroutine);
  if (count == 0) {
    return make_validation_error(
        authorization_error_code::no_functions,
        fmt::format("authorization '{}' has no functions", info.label));
  }
  const auto& domain = conduit::schema::function_domain(info.subroutine, 0);
  for (auto index = std::size_t{1}; index < count; ++index) {
    if (conduit::schema::function_domain(info.subroutine, index) != domain) {
      return make_validation_error(
          authorization_error_code::different_function_domains,
          fmt::format("function {} of '{}' targets {} instead of {}", index,
                      info.label,
                      conduit::schema::to_string(conduit::schema::function_domain(
                          info.subroutine, index)),
                      conduit::schema::to_string(domain)));
    }
  }
  if (conduit::schema::is_permissionless(info.mode) &&
      info.priority.value_or(conduit::schema::priority_t::medium) ==
          conduit::schema::priority_t::high) {
    return make_validation_error(
        authorization_error_code::permissionless_with_high_priority,
        fmt::format("permissionless authorization '{}' cannot be high priority",
                    info.label));
  }
  if (info.max_concurrent_executions && *info.max_concurrent_executions == 0) {
    return make_validation_error(
        authorization_error_code::invalid_max_concurrent_executions,
        "max_concurrent_executions must be positive");
  }
  return std::nullopt;
}

std::optional<validation_error> validate_environment(
    const conduit::schema::subroutine_t& subroutine,
    const std::optional<conduit::schema::execution_environment_t>&
        environment) {
  for (auto index = std::size_t{0};
       index < conduit::schema::function_count(subroutine); ++index) {
    auto type =
        conduit::schema::function_message_details(subroutine, index)
            .message_type;
    auto supported =
        environment ? conduit::router::supports_message_type(*environment, type)
                    : (type == conduit::schema::message_type_t::
                                   cosmwasm_execute_msg ||
                       type == conduit::schema::message_type_t::
                                   cosmwasm_migrate_msg);
    if (!supported) {
      return make_validation_error(
          authorization_error_code::unsupported_message_type,
          fmt::format("function {} uses {} which its domain cannot execute",
                      index, conduit::schema::to_string(type)));
    }
  }
  return std::nullopt;
}

std::optional<validation_error> validate_messages(
    const conduit::schema::subroutine_t& subroutine,
    const std::vector<conduit::schema::processor_message_t>& messages) {
  auto count = conduit::schema::function_count(subroutine);
  if (messages.size() != count) {
    return make_validation_error(
        authorization_error_code::invalid_message_amount,
        fmt::format("expected {} messages, got {}", count, messages.size()));
  }
  for (auto index = std::size_t{0}; index < count; ++index) {
    const auto& details =
        conduit::schema::function_message_details(subroutine, index);
    auto type = conduit::schema::message_type_of(messages[index]);
    if (type != details.message_type) {
      return make_validation_error(
          authorization_error_code::invalid_message_type,
          fmt::format("message {} is {}, expected {}", index,
                      conduit::schema::to_string(type),
                      conduit::schema::to_string(details.message_type)));
    }
    if (!uses_json_body(type)) {
      continue;
    }
    auto error = validate_json_message(
        details.message, conduit::schema::payload_of(messages[index]));
    if (error) {
      error->message = fmt::format("message {}: {}", index, error->message);
      return error;
    }
  }
  return std::nullopt;
}

std::optional<validation_error> validate_json_message(
    const conduit::schema::message_definition_t& definition,
    const conduit::schema::bytes_view_t& body) {
  auto root =
      nlohmann::json::parse(std::begin(body), std::end(body), nullptr, false);
  if (root.is_discarded()) {
    return make_validation_error(authorization_error_code::invalid_json,
                                 "message body is not valid JSON");
  }
  if (!root.is_object() || root.size() != 1) {
    return make_validation_error(
        authorization_error_code::invalid_message_structure,
        "message body must be an object with a single method key");
  }
  if (root.begin().key() != definition.name) {
    return make_validation_error(
        authorization_error_code::message_does_not_match,
        fmt::format("method '{}' does not match '{}'", root.begin().key(),
                    definition.name));
  }
  if (!definition.params_restrictions) {
    return std::nullopt;
  }
  for (const auto& restriction : *definition.params_restrictions) {
    auto error = check_restriction(root, restriction);
    if (error) {
      return error;
    }
  }
  return std::nullopt;
}

}  // namespace conduit::authorization
