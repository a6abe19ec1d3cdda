#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <tollbooth/common/critical.hpp>
#include <tollbooth/config/config.hpp>
#include <tollbooth/rpc/listener.hpp>
#include <tollbooth/service/bootstrap.hpp>
#include <tollbooth/service/facilitator.hpp>
#include <tollbooth/service/worker_pool.hpp>
#include <tollbooth/settlement/scheduler.hpp>
#include <tollbooth/storage/rocksdb/storage.hpp>
#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto config = tollbooth::config::daemon_config{};
  auto vm = boost::program_options::variables_map{};
  auto description = tollbooth::config::command_line_options(config);
  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << "\n" << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "tollbooth", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::from_str(config.log_level));

  if (!config.config_path.empty()) {
    try {
      tollbooth::config::load_file(config.config_path, config);
    } catch (const tollbooth::config::config_error& e) {
      tollbooth::common::critical("invalid configuration: {}", e.what());
    }
  }
  if (config.networks.empty()) {
    spdlog::warn("no networks configured; settle will refuse every payment");
  }

  auto storage = std::shared_ptr<tollbooth::storage::rocksdb_storage_t>{};
  try {
    storage = std::make_shared<tollbooth::storage::rocksdb_storage_t>(
        tollbooth::storage::make_storage<
            tollbooth::storage::rocksdb_storage_tag>(config.db_path));
  } catch (const tollbooth::storage::storage_error& e) {
    tollbooth::common::critical("cannot open payment store: {}", e.what());
  }
  auto adapters = tollbooth::service::make_adapters(
      config.networks, [] { return tollbooth::service::system_clock_ms(); });
  auto facilitator = tollbooth::service::facilitator{
      storage, std::move(adapters),
      std::make_shared<tollbooth::ledger::logging_notification_sink>(),
      tollbooth::service::make_facilitator_options(config.settlement)};

  facilitator.recover();
  auto scheduler = tollbooth::settlement::scheduler{};
  facilitator.start(scheduler);

  spdlog::info("gRPC service listening on {}", config.listen);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto workers = tollbooth::service::worker_pool{config.settlement.workers};
  auto grpc_listener = tollbooth::rpc::listener{facilitator, workers};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(config.listen,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    tollbooth::common::critical("cannot listen on {}", config.listen);
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    spdlog::info("shutting down");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
    workers.stop();
    scheduler.stop();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
