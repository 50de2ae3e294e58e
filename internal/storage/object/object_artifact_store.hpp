#pragma once

#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "internal/storage/artifact_store.hpp"

namespace fieldwake::storage {

/*
  Object storage (S3 / GCS / MinIO) through the Arrow filesystem layer.

  Characteristics:
    - one PUT per artifact, no fsync semantics
    - location is "<scheme>://<root>/<key>" when a scheme is known
*/
class ObjectArtifactStore final : public ArtifactStore {
 public:
  ObjectArtifactStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, std::string scheme = {});

  // Builds the filesystem from a URI such as s3://bucket/prefix.
  static std::shared_ptr<ObjectArtifactStore> FromUri(const std::string& uri);

  std::string Put(const std::string& key, const std::string& bytes) override;

  std::string Get(const std::string& key) override;

  void Remove(const std::string& key) override;

  std::string Kind() const override {
    return "object";
  }

 private:
  std::string ObjectPath(const std::string& key) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
  std::string                            scheme_;
};

} // namespace fieldwake::storage
