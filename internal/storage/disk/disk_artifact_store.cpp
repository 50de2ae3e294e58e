#include "disk_artifact_store.hpp"

#include <arrow/io/file.h>

#include <filesystem>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace fieldwake::storage {

using namespace fieldwake::storage::common;

DiskArtifactStore::DiskArtifactStore(std::filesystem::path root, bool fsync) : root_(std::move(root)), fsync_(fsync) {
  std::filesystem::create_directories(root_);
}

/*
  Atomic write:
      write tmp -> flush -> rename
*/
std::string DiskArtifactStore::Put(const std::string& key, const std::string& bytes) {
  auto final_path = ArtifactPath(root_, key);
  auto tmp_path   = final_path.string() + ".tmp";

  std::filesystem::create_directories(final_path.parent_path());

  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path), "open " + tmp_path);
    Unwrap(out->Write(bytes.data(), static_cast<int64_t>(bytes.size())), "write " + key);

    if (fsync_) Unwrap(out->Flush(), "flush " + key);

    Unwrap(out->Close(), "close " + key);
  }

  std::filesystem::rename(tmp_path, final_path);
  return std::filesystem::absolute(final_path).string();
}

std::string DiskArtifactStore::Get(const std::string& key) {
  const auto path = ArtifactPath(root_, key);
  if (!std::filesystem::exists(path)) throw util::NotFound("artifact " + key);
  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()), "open " + key);
  return ReadArtifact(file, key);
}

void DiskArtifactStore::Remove(const std::string& key) {
  std::filesystem::remove(ArtifactPath(root_, key));
}

} // namespace fieldwake::storage
