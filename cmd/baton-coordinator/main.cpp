#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/workflow/session_config.hpp"

namespace {

constexpr const char* kDefaultConfigPath  = "config/baton.yaml";
constexpr const char* kDefaultBindAddress = "127.0.0.1:50061";

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

struct Options {
  std::string config_path  = kDefaultConfigPath;
  bool        check_config = false;
};

bool ParseArgs(int argc, char** argv, Options* options) {
  bool path_seen = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check-config") {
      options->check_config = true;
    } else if (arg == "--config" && i + 1 < argc && !path_seen) {
      options->config_path = argv[++i];
      path_seen            = true;
    } else if (!arg.empty() && arg[0] != '-' && !path_seen) {
      options->config_path = arg;
      path_seen            = true;
    } else {
      return false;
    }
  }
  return true;
}

// Loads the config and the workflow table exactly as startup would, without
// opening the database or binding the port.
int CheckConfig(const std::string& config_path) {
  auto config = baton::config::ConfigLoader::LoadFromYaml(config_path);
  (void)baton::observability::ParseLogLevel(config.logging().level().empty() ? "info" : config.logging().level());

  auto workflow =
      config.has_workflow() ? baton::workflow::NormalizeWorkflowConfig(config.workflow()) : baton::workflow::DefaultWorkflowConfig();
  baton::workflow::ValidateWorkflowConfig(workflow);

  std::cout << config_path << ": ok (" << workflow.transitions_size() << " transitions, testing mode "
            << baton::coordination::v1::TestingMode_Name(workflow.testing_mode()) << ")" << std::endl;
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  Options options;
  if (!ParseArgs(argc, argv, &options)) {
    std::cerr << "Usage: baton-coordinator [--check-config] [<config.yaml> | --config <config.yaml>]" << std::endl;
    return 1;
  }

  if (options.check_config) {
    try {
      return CheckConfig(options.config_path);
    } catch (const std::exception& e) {
      std::cerr << options.config_path << ": " << e.what() << std::endl;
      return 2;
    }
  }

  try {
    auto config = baton::config::ConfigLoader::LoadFromYaml(options.config_path);

    baton::observability::InitializeTracing(config);
    baton::observability::InitializeMetrics(config);
    baton::observability::InitializeLogging(config);

    auto app = baton::factory::Build(config);

    const std::string bind_address = config.server().bind_address().empty() ? kDefaultBindAddress : config.server().bind_address();
    baton::runtime::Server server(bind_address, std::move(app.grpc_services));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    BATON_LOG_INFO("baton coordinator listening", {baton::observability::StringField("config", options.config_path),
                                                   baton::observability::StringField("bind_address", bind_address),
                                                   baton::observability::IntField("port", server.BoundPort())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    BATON_LOG_INFO("shutting down baton coordinator");

    server.Stop();
    baton::observability::ShutdownLogging();
    baton::observability::ShutdownMetrics();
    baton::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    BATON_LOG_ERROR("fatal error", {baton::observability::StringField("error", e.what())});
    baton::observability::ShutdownLogging();
    baton::observability::ShutdownMetrics();
    baton::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
