#pragma once

#include <memory>

#include "internal/config/engine_settings.hpp"
#include "internal/util/time.hpp"

namespace fieldwake::db {
class Repository;
}
namespace fieldwake::chunks {
class ChunkStore;
}
namespace fieldwake::lineage {
class LineageResolver;
}
namespace fieldwake::storage {
class ArtifactStore;
}
namespace fieldwake::command {
class CommandPublisher;
}
namespace fieldwake::notify {
class CompletionHandler;
class FailureReporter;
}

namespace fieldwake::core {

class DeviceLocks;

/*
  Handles shared by the router, finalizer and sweeper. Nothing in the
  engine reaches for a global; everything it touches is in here.
*/
struct EngineContext {
  config::EngineSettings settings;

  std::shared_ptr<db::Repository>            repository;
  std::shared_ptr<chunks::ChunkStore>        chunks;
  std::shared_ptr<lineage::LineageResolver>  lineage;
  std::shared_ptr<storage::ArtifactStore>    artifacts;
  std::shared_ptr<command::CommandPublisher> commands;
  std::shared_ptr<notify::CompletionHandler> completion;
  std::shared_ptr<notify::FailureReporter>   failures;
  std::shared_ptr<DeviceLocks>               locks;

  util::NowFn now = util::Now;
};

} // namespace fieldwake::core
