#pragma once

#include <memory>

#include "internal/util/time.hpp"

namespace fieldwake::core {
class WakeRouter;
}
namespace fieldwake::sweep {
class ChunkSweeper;
}
namespace fieldwake::command {
class CommandQueue;
}
namespace fieldwake::chunks {
class ChunkStore;
}
namespace fieldwake::db {
class Repository;
}

namespace fieldwake::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<fieldwake::core::WakeRouter>     router;
  std::shared_ptr<fieldwake::sweep::ChunkSweeper>  sweeper;
  std::shared_ptr<fieldwake::command::CommandQueue> commands;
  std::shared_ptr<fieldwake::chunks::ChunkStore>   chunks;
  std::shared_ptr<fieldwake::db::Repository>       repository;

  util::NowFn now = util::Now;
};

} // namespace fieldwake::service
