#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/engine_context.hpp"

namespace fieldwake::command {
class CommandQueue;
}
namespace fieldwake::sweep {
class ChunkSweeper;
}

namespace fieldwake::factory {

/*
  Application

  Owns everything the server needs for the lifetime of the process.
  grpc_services is handed to runtime::Server; the rest stays here.
*/
struct Application {
  core::EngineContext engine;

  std::vector<std::unique_ptr<::grpc::Service>>     grpc_services;
  std::shared_ptr<command::CommandQueue>            commands;
  std::vector<std::shared_ptr<sweep::ChunkSweeper>> background_workers;

  // Stops background workers and wakes every command stream.
  void Stop();
};

// Settings Build() would reject, checked without opening the database or
// storage. With load_registry the lineage registry is parsed as well.
void ValidateConfig(const fieldwake::runtime::config::RuntimeConfig& config, bool load_registry);

std::shared_ptr<db::Repository> BuildRepository(const fieldwake::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: the only place that knows concrete repository,
  storage and lineage types.
*/
Application Build(const fieldwake::runtime::config::RuntimeConfig& config);

} // namespace fieldwake::factory
