#pragma once

#include <conduit/schema/authorization.hpp>
#include <conduit/schema/domain.hpp>
#include <conduit/schema/execution_result.hpp>
#include <conduit/schema/hyperlane.hpp>
#include <conduit/schema/polytone.hpp>
#include <conduit/schema/processor_message.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Schema type: authorization registry messages.
namespace conduit::schema {

template <uint16_t Version>
struct registry_instantiate;

template <>
struct registry_instantiate<1> final {
  uint16_t version{1};
  address_t owner;
  std::vector<address_t> sub_owners;
  address_t processor;
};

using registry_instantiate_t = registry_instantiate<1>;

// Owner only.

template <uint16_t Version>
struct add_sub_owner;

template <>
struct add_sub_owner<1> final {
  uint16_t version{1};
  address_t sub_owner;
};

template <uint16_t Version>
struct remove_sub_owner;

template <>
struct remove_sub_owner<1> final {
  uint16_t version{1};
  address_t sub_owner;
};

using add_sub_owner_t = add_sub_owner<1>;
using remove_sub_owner_t = remove_sub_owner<1>;
using owner_msg_t = std::variant<add_sub_owner_t, remove_sub_owner_t>;

// Owner or sub-owner.

template <uint16_t Version>
struct add_external_domains;

template <>
struct add_external_domains<1> final {
  uint16_t version{1};
  std::vector<external_domain_info_t> external_domains;
};

template <uint16_t Version>
struct create_authorizations;

template <>
struct create_authorizations<1> final {
  uint16_t version{1};
  std::vector<authorization_info_t> authorizations;
};

template <uint16_t Version>
struct modify_authorization;

template <>
struct modify_authorization<1> final {
  uint16_t version{1};
  std::string label;
  std::optional<expiration_t> not_before;
  std::optional<expiration_t> expiration;
  std::optional<uint64_t> max_concurrent_executions;
  std::optional<priority_t> priority;
};

template <uint16_t Version>
struct disable_authorization;

template <>
struct disable_authorization<1> final {
  uint16_t version{1};
  std::string label;
};

template <uint16_t Version>
struct enable_authorization;

template <>
struct enable_authorization<1> final {
  uint16_t version{1};
  std::string label;
};

template <uint16_t Version>
struct mint_authorizations;

template <>
struct mint_authorizations<1> final {
  uint16_t version{1};
  std::string label;
  std::vector<address_allowance_t> mints;
};

template <uint16_t Version>
struct remove_msgs;

template <>
struct remove_msgs<1> final {
  uint16_t version{1};
  domain_t domain;
  uint64_t queue_position{};
  priority_t priority{priority_t::medium};
};

template <uint16_t Version>
struct add_msgs;

template <>
struct add_msgs<1> final {
  uint16_t version{1};
  std::string label;
  uint64_t queue_position{};
  priority_t priority{priority_t::medium};
  std::vector<processor_message_t> messages;
};

template <uint16_t Version>
struct pause_processor;

template <>
struct pause_processor<1> final {
  uint16_t version{1};
  domain_t domain;
};

template <uint16_t Version>
struct resume_processor;

template <>
struct resume_processor<1> final {
  uint16_t version{1};
  domain_t domain;
};

using add_external_domains_t = add_external_domains<1>;
using create_authorizations_t = create_authorizations<1>;
using modify_authorization_t = modify_authorization<1>;
using disable_authorization_t = disable_authorization<1>;
using enable_authorization_t = enable_authorization<1>;
using mint_authorizations_t = mint_authorizations<1>;
using remove_msgs_t = remove_msgs<1>;
using add_msgs_t = add_msgs<1>;
using pause_processor_t = pause_processor<1>;
using resume_processor_t = resume_processor<1>;
using permissioned_msg_t = std::variant<add_external_domains_t,
                                        create_authorizations_t,
                                        modify_authorization_t,
                                        disable_authorization_t,
                                        enable_authorization_t,
                                        mint_authorizations_t,
                                        remove_msgs_t,
                                        add_msgs_t,
                                        pause_processor_t,
                                        resume_processor_t>;

// Anyone, subject to the checks of each action.

template <uint16_t Version>
struct send_msgs;

template <>
struct send_msgs<1> final {
  uint16_t version{1};
  std::string label;
  std::vector<processor_message_t> messages;
  std::optional<expiration_t> ttl;
};

/// Result report; only the recorded callback sender may deliver it.
template <uint16_t Version>
struct processor_callback;

template <>
struct processor_callback<1> final {
  uint16_t version{1};
  execution_id_t execution_id{};
  execution_result_t execution_result;
};

template <uint16_t Version>
struct retry_msgs;

template <>
struct retry_msgs<1> final {
  uint16_t version{1};
  execution_id_t execution_id{};
};

template <uint16_t Version>
struct retry_bridge_creation;

template <>
struct retry_bridge_creation<1> final {
  uint16_t version{1};
  std::string domain_name;
};

using send_msgs_t = send_msgs<1>;
using processor_callback_t = processor_callback<1>;
using retry_msgs_t = retry_msgs<1>;
using retry_bridge_creation_t = retry_bridge_creation<1>;
using permissionless_msg_t = std::variant<send_msgs_t,
                                          processor_callback_t,
                                          retry_msgs_t,
                                          retry_bridge_creation_t>;

using registry_execute_msg_t = std::variant<owner_msg_t,
                                            permissioned_msg_t,
                                            permissionless_msg_t,
                                            polytone_callback_message_t,
                                            hyperlane_handle_t>;

}  // namespace conduit::schema
