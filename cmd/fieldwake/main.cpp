#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

void Usage() {
  std::cerr << "Usage: fieldwake [--check] <config.yaml>\n"
               "       fieldwake [--check] --config <config.yaml>\n"
               "\n"
               "  --check   validate the config and lineage registry, then exit\n";
}

void ShutdownObservability() {
  fieldwake::observability::ShutdownLogging();
  fieldwake::observability::ShutdownMetrics();
  fieldwake::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  bool check_only = false;
  if (!args.empty() && args.front() == "--check") {
    check_only = true;
    args.erase(args.begin());
  }

  std::string config_path;
  if (args.size() == 1) {
    config_path = args[0];
  } else if (args.size() == 2 && args[0] == "--config") {
    config_path = args[1];
  } else {
    Usage();
    return 1;
  }

  if (check_only) {
    try {
      const auto config = fieldwake::config::ConfigLoader::LoadFromYaml(config_path);
      fieldwake::factory::ValidateConfig(config, true);
    } catch (const std::exception& e) {
      std::cerr << config_path << ": " << e.what() << std::endl;
      return 2;
    }
    std::cout << config_path << ": ok" << std::endl;
    return 0;
  }

  try {
    auto config = fieldwake::config::ConfigLoader::LoadFromYaml(config_path);

    fieldwake::observability::InitializeTracing(config);
    fieldwake::observability::InitializeMetrics(config);
    fieldwake::observability::InitializeLogging(config);

    auto app = fieldwake::factory::Build(config);

    fieldwake::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));

    // handlers go in before Start() so an early signal is not lost
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    FIELDWAKE_LOG_INFO("fieldwake started", {fieldwake::observability::StringField("bind_address", config.server().bind_address()),
                                             fieldwake::observability::StringField("config", config_path)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FIELDWAKE_LOG_INFO("fieldwake stopping");

    // sweeper first, then the queue shutdown lets StreamCommands return
    app.Stop();
    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    FIELDWAKE_LOG_ERROR("fatal error", {fieldwake::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
