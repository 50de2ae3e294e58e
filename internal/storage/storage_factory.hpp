#pragma once

#include "artifact_store.hpp"
#include "config/config.pb.h"

namespace fieldwake::storage {

/*
  Builds the artifact store from configuration.

  object.uri set   -> ObjectArtifactStore
  otherwise        -> DiskArtifactStore under disk.root_path
*/
class StorageFactory {
 public:
  static ArtifactStorePtr Build(const fieldwake::runtime::config::StorageConfig& cfg);
};

} // namespace fieldwake::storage
