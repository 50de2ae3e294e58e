#include "object_artifact_store.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace fieldwake::storage {

using namespace fieldwake::storage::common;

ObjectArtifactStore::ObjectArtifactStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, std::string scheme)
    : fs_(std::move(fs)), root_path_(std::move(root_path)), scheme_(std::move(scheme)) {
}

std::shared_ptr<ObjectArtifactStore> ObjectArtifactStore::FromUri(const std::string& uri) {
  auto [fs, root] = ResolveFileSystem(uri);

  std::string scheme;
  auto        pos = uri.find("://");
  if (pos != std::string::npos) scheme = uri.substr(0, pos);

  return std::make_shared<ObjectArtifactStore>(std::move(fs), std::move(root), std::move(scheme));
}

/*
  Object key layout:

      <root_path>/<company>/<site>/<device>/<artifact>
*/
std::string ObjectArtifactStore::ObjectPath(const std::string& key) const {
  ValidateArtifactKey(key);
  if (root_path_.empty()) return key;
  if (root_path_.back() == '/') return root_path_ + key;
  return root_path_ + "/" + key;
}

std::string ObjectArtifactStore::Put(const std::string& key, const std::string& bytes) {
  auto path = ObjectPath(key);
  // object stores have no directories; a local filesystem needs the parents
  if (fs_->type_name() == "local") {
    const auto slash = path.rfind('/');
    if (slash != std::string::npos && slash > 0) Unwrap(fs_->CreateDir(path.substr(0, slash), true), "create " + path.substr(0, slash));
  }
  auto out  = Unwrap(fs_->OpenOutputStream(path), "open " + path);
  Unwrap(out->Write(bytes.data(), static_cast<int64_t>(bytes.size())), "write " + path);
  Unwrap(out->Close(), "close " + path);

  if (scheme_.empty()) return path;
  return scheme_ + "://" + path;
}

std::string ObjectArtifactStore::Get(const std::string& key) {
  auto input = Unwrap(fs_->OpenInputFile(ObjectPath(key)), "open " + key);
  return ReadArtifact(input, key);
}

void ObjectArtifactStore::Remove(const std::string& key) {
  Unwrap(fs_->DeleteFile(ObjectPath(key)), "delete " + key);
}

} // namespace fieldwake::storage
