#include <boost/program_options.hpp>
#include <conduit/common/critical.hpp>
#include <conduit/schema/authorization.hpp>
#include <conduit/schema/authorization_msg.hpp>
#include <conduit/schema/domain.hpp>
#include <conduit/schema/encoding/scale/encoder.hpp>
#include <conduit/schema/processor_msg.hpp>
#include <conduit/schema/transaction.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using encoder_t = conduit::schema::encoding::encoder<
    conduit::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

std::string required(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    conduit::common::critical("missing required argument --" + name);
  }
  return vm[name].as<std::string>();
}

std::vector<std::string> repeated(const po::variables_map& vm,
                                  const std::string& name) {
  if (!vm.contains(name)) {
    return {};
  }
  return vm[name].as<std::vector<std::string>>();
}

conduit::schema::domain_t parse_domain(const std::string& domain) {
  if (domain.empty() || domain == "main") {
    return conduit::schema::domain_main_t{};
  }
  return conduit::schema::domain_external_t{.name = domain};
}

conduit::schema::priority_t parse_priority(const std::string& priority) {
  auto parsed = conduit::schema::try_from_string<conduit::schema::priority_t>(
      priority);
  if (!parsed) {
    conduit::common::critical("priority must be medium|high");
  }
  return *parsed;
}

std::optional<conduit::schema::expiration_t> parse_ttl(
    const po::variables_map& vm) {
  if (vm.contains("ttl-height")) {
    return conduit::schema::expiration_at_height_t{
        .height = vm["ttl-height"].as<uint64_t>()};
  }
  if (vm.contains("ttl-time")) {
    return conduit::schema::expiration_at_time_t{
        .time = vm["ttl-time"].as<uint64_t>()};
  }
  return std::nullopt;
}

std::vector<conduit::schema::processor_message_t> execute_messages(
    const po::variables_map& vm) {
  auto messages = std::vector<conduit::schema::processor_message_t>{};
  for (const auto& body : repeated(vm, "message")) {
    messages.push_back(conduit::schema::cosmwasm_execute_msg_t{
        .msg = conduit::schema::make_bytes(body)});
  }
  return messages;
}

/// One non-atomic function per --library, all calling --method.
conduit::schema::authorization_info_t build_authorization(
    const po::variables_map& vm) {
  auto domain = parse_domain(vm["domain"].as<std::string>());
  auto method = required(vm, "method");
  auto functions = std::vector<conduit::schema::non_atomic_function_t>{};
  for (const auto& library : repeated(vm, "library")) {
    functions.push_back(conduit::schema::non_atomic_function_t{
        .domain = domain,
        .message_details =
            conduit::schema::message_details_t{
                .message_type =
                    conduit::schema::message_type_t::cosmwasm_execute_msg,
                .message = conduit::schema::message_definition_t{.name =
                                                                     method}},
        .contract_address = library});
  }
  if (functions.empty()) {
    conduit::common::critical("create-authorization requires --library");
  }

  auto mode = conduit::schema::authorization_mode_t{
      conduit::schema::mode_permissionless_t{}};
  if (auto allowed = repeated(vm, "allowed"); !allowed.empty()) {
    mode = conduit::schema::mode_permissioned_t{
        .permission = conduit::schema::permission_without_call_limit_t{
            .addresses = allowed}};
  }

  auto duration = conduit::schema::authorization_duration_t{
      conduit::schema::lifetime_forever_t{}};
  if (vm.contains("lifetime-seconds")) {
    duration = conduit::schema::lifetime_seconds_t{
        .seconds = vm["lifetime-seconds"].as<uint64_t>()};
  }

  return conduit::schema::authorization_info_t{
      .label = required(vm, "label"),
      .mode = std::move(mode),
      .not_before = conduit::schema::expiration_never_t{},
      .duration = duration,
      .max_concurrent_executions =
          vm["max-concurrent"].as<uint64_t>(),
      .subroutine =
          conduit::schema::non_atomic_subroutine_t{.functions =
                                                       std::move(functions)},
      .priority = parse_priority(vm["priority"].as<std::string>())};
}

conduit::schema::external_domain_info_t build_external_domain(
    const po::variables_map& vm) {
  auto environment = conduit::schema::execution_environment_info_t{};
  if (vm.contains("mailbox")) {
    environment = conduit::schema::evm_environment_t{
        .encoder =
            conduit::schema::evm_encoder_t{
                .broker_address = vm["broker"].as<std::string>(),
                .encoder_version = vm["encoder-version"].as<std::string>()},
        .hyperlane = conduit::schema::hyperlane_connector_t{
            .mailbox = required(vm, "mailbox"),
            .domain_id = vm["hyperlane-domain-id"].as<uint32_t>()}};
  } else {
    environment = conduit::schema::polytone_connectors_info_t{
        .note =
            conduit::schema::polytone_note_info_t{
                .address = required(vm, "note"),
                .timeout_seconds = vm["timeout-seconds"].as<uint64_t>()},
        .proxy = required(vm, "proxy")};
  }
  return conduit::schema::external_domain_info_t{
      .name = required(vm, "domain-name"),
      .execution_environment = std::move(environment),
      .processor = required(vm, "domain-processor")};
}

conduit::schema::bytes_t build_registry_msg(const std::string& command,
                                            const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto domain = parse_domain(vm["domain"].as<std::string>());
  if (command == "send-msgs") {
    return encoder.encode(conduit::schema::registry_execute_msg_t{
        conduit::schema::permissionless_msg_t{conduit::schema::send_msgs_t{
            .label = required(vm, "label"),
            .messages = execute_messages(vm),
            .ttl = parse_ttl(vm)}}});
  }
  if (command == "create-authorization") {
    return encoder.encode(conduit::schema::registry_execute_msg_t{
        conduit::schema::permissioned_msg_t{
            conduit::schema::create_authorizations_t{
                .authorizations = {build_authorization(vm)}}}});
  }
  if (command == "add-domain") {
    return encoder.encode(conduit::schema::registry_execute_msg_t{
        conduit::schema::permissioned_msg_t{
            conduit::schema::add_external_domains_t{
                .external_domains = {build_external_domain(vm)}}}});
  }
  if (command == "pause") {
    return encoder.encode(conduit::schema::registry_execute_msg_t{
        conduit::schema::permissioned_msg_t{
            conduit::schema::pause_processor_t{.domain = domain}}});
  }
  if (command == "resume") {
    return encoder.encode(conduit::schema::registry_execute_msg_t{
        conduit::schema::permissioned_msg_t{
            conduit::schema::resume_processor_t{.domain = domain}}});
  }
  conduit::common::critical(
      "command must be send-msgs|create-authorization|add-domain|pause|"
      "resume|tick");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  conduit_tx_builder send-msgs --label L --message JSON...\n"
            << "  conduit_tx_builder create-authorization --label L "
               "--library ADDR --method NAME\n"
            << "  conduit_tx_builder add-domain --domain-name N "
               "--domain-processor ADDR (--note ADDR --proxy ADDR | "
               "--mailbox ADDR)\n"
            << "  conduit_tx_builder pause|resume [--domain NAME]\n"
            << "  conduit_tx_builder tick\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"conduit_tx_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "send-msgs|create-authorization|add-domain|pause|resume|tick")(
      "chain-id", po::value<std::string>()->default_value("conduit-main"),
      "chain the transaction is for")(
      "sender", po::value<std::string>()->default_value("owner"),
      "sending address")(
      "registry", po::value<std::string>()->default_value("registry"),
      "authorization registry address")(
      "processor", po::value<std::string>()->default_value("processor"),
      "main domain processor address")(
      "label", po::value<std::string>(), "authorization label")(
      "message", po::value<std::vector<std::string>>()->multitoken(),
      "JSON body of a cosmwasm execute message")(
      "ttl-height", po::value<uint64_t>(), "bridge ttl as block height")(
      "ttl-time", po::value<uint64_t>(), "bridge ttl as block time")(
      "domain", po::value<std::string>()->default_value("main"),
      "main or an external domain name")(
      "library", po::value<std::vector<std::string>>()->multitoken(),
      "library address, one function each")(
      "method", po::value<std::string>(), "library method name")(
      "allowed", po::value<std::vector<std::string>>()->multitoken(),
      "permissioned addresses; permissionless when absent")(
      "priority", po::value<std::string>()->default_value("medium"),
      "medium|high")(
      "max-concurrent", po::value<uint64_t>()->default_value(1),
      "max concurrent executions")(
      "lifetime-seconds", po::value<uint64_t>(),
      "authorization lifetime in seconds")(
      "domain-name", po::value<std::string>(), "external domain name")(
      "domain-processor", po::value<std::string>(),
      "processor address on the external domain")(
      "note", po::value<std::string>(), "polytone note address")(
      "proxy", po::value<std::string>(),
      "processor's polytone proxy on the main domain")(
      "timeout-seconds", po::value<uint64_t>()->default_value(600),
      "polytone packet timeout")(
      "mailbox", po::value<std::string>(), "hyperlane mailbox address")(
      "hyperlane-domain-id", po::value<uint32_t>()->default_value(0),
      "hyperlane domain id")(
      "broker", po::value<std::string>()->default_value(""),
      "evm encoder broker address")(
      "encoder-version", po::value<std::string>()->default_value("v1"),
      "evm encoder version");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  auto encoder = encoder_t{};
  auto transaction = conduit::schema::transaction_t{
      .chain_id = vm["chain-id"].as<std::string>(),
      .sender = vm["sender"].as<std::string>()};
  if (command == "tick") {
    transaction.contract = vm["processor"].as<std::string>();
    transaction.msg = encoder.encode(conduit::schema::processor_execute_msg_t{
        conduit::schema::processor_permissionless_msg_t{
            conduit::schema::tick_t{}}});
  } else {
    transaction.contract = vm["registry"].as<std::string>();
    transaction.msg = build_registry_msg(command, vm);
  }

  std::cout << conduit::schema::to_base64(encoder.encode(transaction)) << '\n';
  return 0;
}
