#pragma once

#include <filesystem>
#include <string>

#include "internal/storage/artifact_store.hpp"

namespace fieldwake::storage {

/*
  Durable disk storage using Arrow IO.

  Properties:
    - atomic replace writes (tmp -> rename)
    - optional fsync
    - location is the absolute file path
*/
class DiskArtifactStore final : public ArtifactStore {
 public:
  explicit DiskArtifactStore(std::filesystem::path root, bool fsync = false);

  std::string Put(const std::string& key, const std::string& bytes) override;

  std::string Get(const std::string& key) override;

  void Remove(const std::string& key) override;

  std::string Kind() const override {
    return "disk";
  }

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
  bool                  fsync_;
};

} // namespace fieldwake::storage
