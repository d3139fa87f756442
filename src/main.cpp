#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <agora/abci/server.hpp>
#include <agora/storage/rocksdb/storage.hpp>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

std::optional<agora::schema::hash32_t> parse_identity(
    const boost::program_options::variables_map& vm,
    const std::string& name) {
  auto value = vm[name].as<std::string>();
  auto parsed = agora::schema::try_make_hash32(value);
  if (!parsed) {
    spdlog::error("Option --{} is neither 64 hex chars nor a label of at most "
                  "32 chars: '{}'",
                  name, value);
  }
  return parsed;
}

std::optional<agora::schema::amount_t> parse_amount(
    const boost::program_options::variables_map& vm,
    const std::string& name) {
  auto value = vm[name].as<std::string>();
  auto parsed = agora::schema::try_make_amount(value);
  if (!parsed) {
    spdlog::error("Option --{} is not an unsigned 256-bit integer: '{}'", name,
                  value);
  }
  return parsed;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto config_path = std::string{};
  auto strict_crypto = true;

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Agora"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", boost::program_options::value<std::string>(&config_path),
      "INI-style configuration file")(
      "grpc-address,g",
      boost::program_options::value<std::string>(&grpc_address)
          ->default_value("0.0.0.0:26658"),
      "IP:Port for the ABCI server")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "agora-data"),
      "RocksDB directory")(
      "chain-id", boost::program_options::value<std::string>()->default_value(
                      "agora-local"),
      "Local chain id (64 hex chars or a label)")(
      "administrator",
      boost::program_options::value<std::string>()->default_value("admin"),
      "Administrator identity (64 hex chars or a label)")(
      "receiver",
      boost::program_options::value<std::string>()->default_value("receiver"),
      "Receiver address remote chains must target")(
      "creation-fee",
      boost::program_options::value<std::string>()->default_value("0"),
      "DAO creation fee")(
      "dispatch-fee",
      boost::program_options::value<std::string>()->default_value("0"),
      "Cross-chain dispatch fee")(
      "strict-crypto",
      boost::program_options::value<bool>(&strict_crypto)->default_value(true),
      "Verify transaction signatures")(
      "log-level",
      boost::program_options::value<std::string>(&log_level)->default_value(
          "info"),
      "trace, debug, info, warn, error or critical")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "agora.log"),
      "Log file path");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    if (vm.contains("config")) {
      auto config = std::ifstream{vm["config"].as<std::string>()};
      if (!config.good()) {
        std::cerr << "Unable to open config file '"
                  << vm["config"].as<std::string>() << "'" << std::endl;
        return 1;
      }
      boost::program_options::store(
          boost::program_options::parse_config_file(config, description), vm);
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << std::endl << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "agorad", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  auto chain_id = parse_identity(vm, "chain-id");
  auto administrator = parse_identity(vm, "administrator");
  auto receiver = parse_identity(vm, "receiver");
  auto creation_fee = parse_amount(vm, "creation-fee");
  auto dispatch_fee = parse_amount(vm, "dispatch-fee");
  if (!chain_id || !administrator || !receiver || !creation_fee ||
      !dispatch_fee) {
    spdlog::shutdown();
    return 1;
  }

  auto encoder = agora::schema::encoding::encoder<
      agora::schema::encoding::scale_encoder_tag>{};
  auto storage =
      agora::storage::make_storage<agora::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = agora::execution::engine{
      encoder, storage,
      agora::execution::engine_options{.chain_id = *chain_id,
                                       .administrator = *administrator,
                                       .receiver = *receiver,
                                       .creation_fee = *creation_fee,
                                       .dispatch_fee = *dispatch_fee,
                                       .require_strict_crypto = strict_crypto}};

  spdlog::info("gRPC service listening on {}", grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = agora::abci::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC server on {}", grpc_address);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    spdlog::info("Shutdown requested");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
