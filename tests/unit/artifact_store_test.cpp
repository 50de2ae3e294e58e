#include "internal/storage/disk/disk_artifact_store.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/object/object_artifact_store.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using fieldwake::storage::DiskArtifactStore;
using fieldwake::storage::common::ArtifactKey;

fs::path FreshRoot(const std::string& name) {
  const auto root = fs::temp_directory_path() / "fieldwake_artifact_store_tests" / name;
  fs::remove_all(root);
  return root;
}

void TestKeyLayoutFillsMissingOwners() {
  assert(ArtifactKey("acme", "north-field", "AABBCCDDEEFF", "a.jpg") == "acme/north-field/AABBCCDDEEFF/a.jpg");
  assert(ArtifactKey("", "", "AABBCCDDEEFF", "a.jpg") == "unassigned/unassigned/AABBCCDDEEFF/a.jpg");
}

void TestKeysCannotEscapeTheRoot() {
  for (const auto& bad : {std::string(".."), std::string("a/b"), std::string("")}) {
    bool threw = false;
    try {
      (void)ArtifactKey("acme", "north-field", "AABBCCDDEEFF", bad);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestDiskPutGetRemove() {
  const auto        root = FreshRoot("disk");
  DiskArtifactStore store(root, true);

  const std::string jpeg("\xFF\xD8\x00jpeg\xFF\xD9", 9);
  const auto        key      = ArtifactKey("acme", "north-field", "AABBCCDDEEFF", "AABBCCDDEEFF_1.jpg");
  const auto        location = store.Put(key, jpeg);

  assert(location == fs::absolute(root / key).string());
  assert(fs::exists(root / key));
  assert(!fs::exists(root / (key + ".tmp")));
  assert(store.Get(key) == jpeg);

  // a retried upload replaces the object
  store.Put(key, "second");
  assert(store.Get(key) == "second");

  store.Remove(key);
  assert(!fs::exists(root / key));
}

void TestDiskMissingArtifactIsNotFound() {
  DiskArtifactStore store(FreshRoot("missing"));
  bool              threw = false;
  try {
    (void)store.Get("acme/north-field/AABBCCDDEEFF/none.jpg");
  } catch (const fieldwake::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestObjectStoreOverLocalUri() {
  const auto root  = FreshRoot("object");
  fs::create_directories(root);
  auto       store = fieldwake::storage::ObjectArtifactStore::FromUri("file://" + root.string());

  const auto key      = ArtifactKey("acme", "north-field", "AABBCCDDEEFF", "b.jpg");
  const auto location = store->Put(key, "bytes");
  assert(location.rfind("file://", 0) == 0);
  assert(store->Get(key) == "bytes");
  assert(store->Kind() == "object");
}

void TestFactoryPrefersObjectUri() {
  fieldwake::runtime::config::StorageConfig cfg;
  cfg.mutable_disk()->set_root_path(FreshRoot("factory_disk").string());
  assert(fieldwake::storage::StorageFactory::Build(cfg)->Kind() == "disk");

  const auto object_root = FreshRoot("factory_object");
  fs::create_directories(object_root);
  cfg.mutable_object()->set_uri("file://" + object_root.string());
  assert(fieldwake::storage::StorageFactory::Build(cfg)->Kind() == "object");
}

} // namespace

int main() {
  TestKeyLayoutFillsMissingOwners();
  TestKeysCannotEscapeTheRoot();
  TestDiskPutGetRemove();
  TestDiskMissingArtifactIsNotFound();
  TestObjectStoreOverLocalUri();
  TestFactoryPrefersObjectUri();

  std::cout << "fieldwake_unit_artifact_store: pass\n";
  return 0;
}
