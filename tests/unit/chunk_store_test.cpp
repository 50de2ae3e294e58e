#include "internal/chunks/chunk_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "fakes/engine_fakes.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace {

using fieldwake::chunks::AssemblyError;
using fieldwake::chunks::ChunkStore;
using fieldwake::testing::FakeClock;

constexpr const char* kDevice   = "AABBCCDDEEFF";
constexpr const char* kArtifact = "AABBCCDDEEFF_1.jpg";

struct Fixture {
  FakeClock                                                clock;
  std::shared_ptr<fieldwake::db::memory::MemoryRepository> repo = std::make_shared<fieldwake::db::memory::MemoryRepository>();
  ChunkStore                                               store{repo, std::chrono::seconds(60), clock.Fn()};
};

void TestStoreIsIdempotentPerIndex() {
  Fixture f;

  assert(f.store.StoreFragment(kDevice, kArtifact, 0, "first"));
  assert(!f.store.StoreFragment(kDevice, kArtifact, 0, "second"));
  assert(f.store.Count() == 1);

  // the first bytes win
  assert(f.store.Assemble(kDevice, kArtifact, 1) == "first");
}

void TestCompletenessAndMissingIndices() {
  Fixture f;

  f.store.StoreFragment(kDevice, kArtifact, 0, "a");
  f.store.StoreFragment(kDevice, kArtifact, 2, "c");
  f.store.StoreFragment(kDevice, kArtifact, 4, "e");

  assert(!f.store.IsComplete(kDevice, kArtifact, 5));
  const auto missing = f.store.MissingIndices(kDevice, kArtifact, 5);
  assert((missing == std::vector<uint32_t>{1, 3}));

  f.store.StoreFragment(kDevice, kArtifact, 1, "b");
  f.store.StoreFragment(kDevice, kArtifact, 3, "d");
  assert(f.store.IsComplete(kDevice, kArtifact, 5));
  assert(f.store.MissingIndices(kDevice, kArtifact, 5).empty());
  assert(f.store.Assemble(kDevice, kArtifact, 5) == "abcde");
}

void TestZeroTotalIsNeverComplete() {
  Fixture f;
  f.store.StoreFragment(kDevice, kArtifact, 0, "a");

  assert(!f.store.IsComplete(kDevice, kArtifact, 0));

  bool threw = false;
  try {
    (void)f.store.Assemble(kDevice, kArtifact, 0);
  } catch (const AssemblyError&) {
    threw = true;
  }
  assert(threw);
}

void TestIndicesBeyondTotalAreIgnored() {
  Fixture f;
  f.store.StoreFragment(kDevice, kArtifact, 0, "a");
  f.store.StoreFragment(kDevice, kArtifact, 1, "b");
  f.store.StoreFragment(kDevice, kArtifact, 7, "stray");

  assert(f.store.IsComplete(kDevice, kArtifact, 2));
  assert(f.store.Assemble(kDevice, kArtifact, 2) == "ab");
}

void TestAssembleWithGapThrows() {
  Fixture f;
  f.store.StoreFragment(kDevice, kArtifact, 0, "a");
  f.store.StoreFragment(kDevice, kArtifact, 2, "c");

  bool threw = false;
  try {
    (void)f.store.Assemble(kDevice, kArtifact, 3);
  } catch (const AssemblyError&) {
    threw = true;
  }
  assert(threw);
}

void TestKeysAreScopedByDevice() {
  Fixture f;
  f.store.StoreFragment(kDevice, kArtifact, 0, "mine");
  assert(f.store.StoreFragment("112233445566", kArtifact, 0, "theirs"));

  assert(f.store.Assemble(kDevice, kArtifact, 1) == "mine");
  assert(f.store.Assemble("112233445566", kArtifact, 1) == "theirs");

  assert(f.store.Clear(kDevice, kArtifact) == 1);
  assert(!f.store.HasFragments(kDevice, kArtifact));
  assert(f.store.HasFragments("112233445566", kArtifact));
}

void TestNewFragmentExtendsExpiryOfWholeArtifact() {
  Fixture f;
  f.store.StoreFragment(kDevice, kArtifact, 0, "a");

  f.clock.Advance(std::chrono::seconds(50));
  f.store.StoreFragment(kDevice, kArtifact, 1, "b");

  // 70s after the first fragment, 20s after the second
  f.clock.Advance(std::chrono::seconds(20));
  assert(f.store.SweepExpired(f.clock.Now()).empty());
  assert(f.store.Count() == 2);

  f.clock.Advance(std::chrono::seconds(40));
  const auto expired = f.store.SweepExpired(f.clock.Now());
  assert(expired.size() == 1);
  assert(expired[0].device_id == kDevice && expired[0].artifact_name == kArtifact);
  assert(f.store.Count() == 0);
}

void TestDuplicateDoesNotExtendExpiry() {
  Fixture f;
  f.store.StoreFragment(kDevice, kArtifact, 0, "a");

  f.clock.Advance(std::chrono::seconds(50));
  assert(!f.store.StoreFragment(kDevice, kArtifact, 0, "a"));

  f.clock.Advance(std::chrono::seconds(10));
  assert(f.store.SweepExpired(f.clock.Now()).size() == 1);
}

} // namespace

int main() {
  TestStoreIsIdempotentPerIndex();
  TestCompletenessAndMissingIndices();
  TestZeroTotalIsNeverComplete();
  TestIndicesBeyondTotalAreIgnored();
  TestAssembleWithGapThrows();
  TestKeysAreScopedByDevice();
  TestNewFragmentExtendsExpiryOfWholeArtifact();
  TestDuplicateDoesNotExtendExpiry();

  std::cout << "fieldwake_unit_chunk_store: pass\n";
  return 0;
}
