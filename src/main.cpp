#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <conduit/authorization/registry.hpp>
#include <conduit/common/critical.hpp>
#include <conduit/host/chain.hpp>
#include <conduit/processor/engine.hpp>
#include <conduit/schema/authorization_msg.hpp>
#include <conduit/schema/encoding/scale/encoder.hpp>
#include <conduit/schema/processor_msg.hpp>
#include <conduit/storage/rocksdb/storage.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

namespace {

using encoder_t = conduit::schema::encoding::scale_encoder_t;

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

struct daemon_config final {
  std::string db_path;
  std::string chain_id;
  std::string owner;
  std::string registry;
  std::string processor;
  std::string keeper;
  bool keeper_enabled{false};
  uint64_t block_seconds{conduit::host::kDefaultBlockSeconds};
};

void log_result(const std::string_view what,
                const conduit::schema::transaction_result_t& result) {
  if (result.ok()) {
    spdlog::info("{} ok ({} events)", what, result.events.size());
  } else {
    spdlog::warn("{} failed: {}/{} {}", what, result.codespace, result.code,
                 result.log);
  }
}

/// Instantiate the registry and the main processor on an empty database.
void bootstrap(conduit::host::chain& chain, const daemon_config& config) {
  chain.register_contract(config.registry,
                          std::make_shared<conduit::authorization::registry>(),
                          config.owner);
  chain.register_contract(config.processor,
                          std::make_shared<conduit::processor::engine>(),
                          config.owner);

  auto encoder = encoder_t{};
  if (!chain.is_instantiated(config.registry)) {
    auto msg = encoder.encode(conduit::schema::registry_instantiate_t{
        .owner = config.owner, .processor = config.processor});
    auto result = chain.instantiate(config.owner, config.registry,
                                    conduit::schema::bytes_view_t{msg});
    if (!result.ok()) {
      conduit::common::critical("registry instantiation failed: " +
                                result.log);
    }
    log_result("instantiate registry", result);
  }
  if (!chain.is_instantiated(config.processor)) {
    auto msg = encoder.encode(conduit::schema::processor_instantiate_t{
        .owner = config.owner,
        .authorization_contract = config.registry,
        .processor_domain = conduit::schema::processor_domain_main_t{}});
    auto result = chain.instantiate(config.owner, config.processor,
                                    conduit::schema::bytes_view_t{msg});
    if (!result.ok()) {
      conduit::common::critical("processor instantiation failed: " +
                                result.log);
    }
    log_result("instantiate processor", result);
  }
}

/// Close the open block, ticking the processor first when keeping.
void finish_block(conduit::host::chain& chain, const daemon_config& config) {
  if (config.keeper_enabled) {
    auto tick = encoder_t{}.encode(conduit::schema::processor_execute_msg_t{
        conduit::schema::processor_permissionless_msg_t{
            conduit::schema::tick_t{}}});
    log_result("keeper tick",
               chain.execute(config.keeper, config.processor,
                             conduit::schema::bytes_view_t{tick}));
  }
  auto committed = chain.advance_block(1, config.block_seconds);
  spdlog::info(
      "Committed height {} app hash {}", committed.height,
      conduit::schema::to_hex(conduit::schema::bytes_view_t{committed.app_hash}));
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);

  auto config = daemon_config{};
  auto log_level = std::string{};
  auto log_file = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"conduitd"};
  description.add_options()("help,h", "Show the help message")(
      "db,d",
      boost::program_options::value<std::string>(&config.db_path)
          ->default_value("conduit.db"),
      "RocksDB state directory")(
      "chain-id",
      boost::program_options::value<std::string>(&config.chain_id)
          ->default_value("conduit-main"),
      "Chain id transactions must carry")(
      "owner",
      boost::program_options::value<std::string>(&config.owner)
          ->default_value("owner"),
      "Owner of the registry and processor")(
      "registry",
      boost::program_options::value<std::string>(&config.registry)
          ->default_value("registry"),
      "Authorization registry address")(
      "processor",
      boost::program_options::value<std::string>(&config.processor)
          ->default_value("processor"),
      "Main domain processor address")(
      "block-seconds",
      boost::program_options::value<uint64_t>(&config.block_seconds)
          ->default_value(conduit::host::kDefaultBlockSeconds),
      "Block time step")(
      "keeper",
      boost::program_options::value<std::string>(&config.keeper)
          ->implicit_value("keeper"),
      "Tick the processor at the end of every block as this sender")(
      "log-level",
      boost::program_options::value<std::string>(&log_level)
          ->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)
          ->default_value("conduitd.log"),
      "Log file path");
  boost::program_options::store(
      boost::program_options::parse_command_line(argc, argv, description), vm);
  boost::program_options::notify(vm);

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }
  config.keeper_enabled = vm.contains("keeper");

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "conduitd", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  auto storage =
      conduit::storage::make_storage<conduit::storage::rocksdb_storage_tag>(
          config.db_path);
  auto genesis = std::chrono::duration_cast<std::chrono::seconds>(
                     std::chrono::system_clock::now().time_since_epoch())
                     .count();
  auto chain = conduit::host::chain{
      config.chain_id, storage,
      static_cast<conduit::schema::timestamp_seconds_t>(genesis)};
  bootstrap(chain, config);

  // One base64 transaction per line; an empty line closes the block.
  auto line = std::string{};
  auto pending = std::size_t{0};
  while (!shutdown_requested() && std::getline(std::cin, line)) {
    if (line.empty()) {
      finish_block(chain, config);
      pending = 0;
      continue;
    }
    auto encoded = conduit::schema::try_from_base64(line);
    if (!encoded) {
      spdlog::warn("Skipping line that is not base64");
      continue;
    }
    log_result("transaction",
               chain.submit(conduit::schema::bytes_view_t{*encoded}));
    ++pending;
  }
  if (pending > 0 || config.keeper_enabled) {
    finish_block(chain, config);
  }

  spdlog::info("conduitd stopped at height {}", chain.block().height);
  spdlog::shutdown();
  return 0;
}
