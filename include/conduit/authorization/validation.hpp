#pragma once

#include <conduit/schema/authorization.hpp>
#include <conduit/schema/authorization_error_code.hpp>
#include <conduit/schema/domain.hpp>
#include <conduit/schema/message_details.hpp>
#include <conduit/schema/processor_message.hpp>
#include <conduit/schema/subroutine.hpp>
#include <optional>
#include <string>
#include <vector>

namespace conduit::authorization {

struct validation_error final {
  conduit::schema::authorization_error_code code;
  std::string message;
};

/// Checks that need no registry state: label, function list, domain
/// uniformity, priority and concurrency settings.
std::optional<validation_error> validate_authorization_info(
    const conduit::schema::authorization_info_t& info);

/// Every function must be runnable by the target environment. An empty
/// environment stands for the main domain.
std::optional<validation_error> validate_environment(
    const conduit::schema::subroutine_t& subroutine,
    const std::optional<conduit::schema::execution_environment_t>&
        environment);

/// Messages must line up one to one with the subroutine's functions.
std::optional<validation_error> validate_messages(
    const conduit::schema::subroutine_t& subroutine,
    const std::vector<conduit::schema::processor_message_t>& messages);

/// Structural check of one JSON body against a message definition.
std::optional<validation_error> validate_json_message(
    const conduit::schema::message_definition_t& definition,
    const conduit::schema::bytes_view_t& body);

}  // namespace conduit::authorization
