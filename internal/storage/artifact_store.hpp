#pragma once

#include <memory>
#include <string>

namespace fieldwake::storage {

/*
  Durable home for finished artifacts.

  Keys are relative, '/'-separated paths built by common::ArtifactKey.
  Put returns the location string recorded on the transfer; what it looks
  like depends on the backend (absolute path, object URI).

  Implementations:
    DISK     -> Arrow local file IO
    OBJECT   -> Arrow filesystem (S3 / GCS / any registered URI scheme)
*/
class ArtifactStore {
 public:
  virtual ~ArtifactStore() = default;

  virtual std::string Put(const std::string& key, const std::string& bytes) = 0;

  virtual std::string Get(const std::string& key) = 0;

  virtual void Remove(const std::string& key) = 0;

  virtual std::string Kind() const = 0;
};

using ArtifactStorePtr = std::shared_ptr<ArtifactStore>;

} // namespace fieldwake::storage
