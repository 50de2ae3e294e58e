#include "storage_factory.hpp"

#include <filesystem>

#include "disk/disk_artifact_store.hpp"
#include "internal/observability/logging.hpp"
#include "object/object_artifact_store.hpp"

namespace fieldwake::storage {

ArtifactStorePtr StorageFactory::Build(const fieldwake::runtime::config::StorageConfig& cfg) {
  if (!cfg.object().uri().empty()) {
    FIELDWAKE_LOG_INFO("artifact store", {observability::StringField("kind", "object"), observability::StringField("uri", cfg.object().uri())});
    return ObjectArtifactStore::FromUri(cfg.object().uri());
  }

  std::filesystem::path disk_root =
      cfg.disk().root_path().empty() ? std::filesystem::path{"/tmp/fieldwake/artifacts"} : std::filesystem::path{cfg.disk().root_path()};
  FIELDWAKE_LOG_INFO("artifact store", {observability::StringField("kind", "disk"), observability::StringField("root", disk_root.string())});
  return std::make_shared<DiskArtifactStore>(std::move(disk_root), cfg.disk().fsync());
}

} // namespace fieldwake::storage
