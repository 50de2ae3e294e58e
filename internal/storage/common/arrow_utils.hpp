#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace fieldwake::storage::common {

/*
  Arrow status -> engine exception.

  IO and cancellation errors come from the backing store (disk full, bucket
  unreachable) and surface as util::Unavailable so the finalizer records an
  upload failure the device can retry. Missing keys are util::NotFound.
*/
[[noreturn]] inline void ThrowStatus(const arrow::Status& status, const std::string& context) {
  const auto what = context + ": " + status.ToString();
  if (status.IsKeyError()) throw util::NotFound(what);
  if (status.IsIOError() || status.IsCancelled()) throw util::Unavailable(what);
  if (status.IsInvalid()) throw std::invalid_argument(what);
  throw std::runtime_error(what);
}

template <typename T>
T Unwrap(arrow::Result<T> result, const std::string& context) {
  if (!result.ok()) ThrowStatus(result.status(), context);
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status, const std::string& context) {
  if (!status.ok()) ThrowStatus(status, context);
}

inline std::string ReadArtifact(const std::shared_ptr<arrow::io::RandomAccessFile>& file, const std::string& key) {
  const auto size   = Unwrap(file->GetSize(), "size " + key);
  const auto buffer = Unwrap(file->Read(size), "read " + key);
  return buffer->ToString();
}

/*
  Resolve "s3://bucket/prefix", "gs://...", "file:///..." or a plain local
  path into a filesystem plus the root path inside it.
*/
inline std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string> ResolveFileSystem(const std::string& uri) {
  std::string root;
  auto        fs = Unwrap(arrow::fs::FileSystemFromUriOrPath(uri, &root), "resolve artifact store " + uri);
  return {std::move(fs), std::move(root)};
}

} // namespace fieldwake::storage::common
