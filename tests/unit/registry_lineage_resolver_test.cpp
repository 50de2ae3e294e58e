#include "internal/lineage/registry_lineage_resolver.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using fieldwake::lineage::RegistryLineageResolver;

constexpr const char* kRegistry = R"(sites:
  - id: north-field
    name: North Field
    program_id: spring-trial
    company_id: acme
    timezone: America/Denver
    wake_schedule: "0 8,16 * * *"
devices:
  - device_id: "aa:bb:cc:dd:ee:ff"
    site_id: north-field
    approved: true
    wake_schedule: "0 */6 * * *"
  - device_id: "11-22-33-44-55-66"
    site_id: north-field
  - device_id: "665544332211"
)";

std::filesystem::path WriteRegistry(const std::string& test_name, const std::string& yaml) {
  const auto base_dir = std::filesystem::temp_directory_path() / "fieldwake_registry_tests";
  std::filesystem::create_directories(base_dir);

  const auto    path = base_dir / (test_name + ".yaml");
  std::ofstream out(path);
  out << yaml;
  out.close();
  return path;
}

void TestResolvesSiteAndDeviceFields() {
  RegistryLineageResolver resolver(WriteRegistry("resolve", kRegistry));
  assert(resolver.DeviceCount() == 3);

  // registry ids and lookups are both normalised
  const auto lineage = resolver.Resolve("AA:BB:CC:DD:EE:FF");
  assert(lineage.has_value());
  assert(lineage->device_id == "AABBCCDDEEFF");
  assert(lineage->mapped && lineage->approved);
  assert(lineage->site_name == "North Field");
  assert(lineage->company_id == "acme");
  assert(lineage->timezone == "America/Denver");
  assert(lineage->device_schedule == "0 */6 * * *");
  assert(lineage->site_schedule == "0 8,16 * * *");
}

void TestMappedButUnapprovedAndUnmapped() {
  RegistryLineageResolver resolver(WriteRegistry("states", kRegistry));

  const auto pending = resolver.Resolve("112233445566");
  assert(pending->mapped);
  assert(!pending->approved);

  const auto unmapped = resolver.Resolve("665544332211");
  assert(!unmapped->mapped);
  assert(unmapped->site_id.empty());

  assert(!resolver.Resolve("000000000000").has_value());
}

void TestUnknownSiteFailsInitialLoad() {
  const auto path = WriteRegistry("bad_site", R"(devices:
  - device_id: "AABBCCDDEEFF"
    site_id: nowhere
)");

  bool threw = false;
  try {
    RegistryLineageResolver resolver(path);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestBrokenReloadKeepsPreviousSnapshot() {
  const auto              path = WriteRegistry("reload", kRegistry);
  RegistryLineageResolver resolver(path);
  assert(resolver.Resolve("AABBCCDDEEFF").has_value());

  {
    std::ofstream out(path);
    out << "devices: [unterminated\n";
  }
  std::filesystem::last_write_time(path, std::filesystem::last_write_time(path) + std::chrono::seconds(5));

  assert(resolver.Resolve("AABBCCDDEEFF").has_value());
  assert(resolver.DeviceCount() == 3);
}

void TestChangedFileIsPickedUp() {
  const auto              path = WriteRegistry("pickup", kRegistry);
  RegistryLineageResolver resolver(path);
  assert(!resolver.Resolve("000000000000").has_value());

  {
    std::ofstream out(path, std::ios::app);
    out << "  - device_id: \"000000000000\"\n";
  }
  std::filesystem::last_write_time(path, std::filesystem::last_write_time(path) + std::chrono::seconds(5));

  assert(resolver.Resolve("000000000000").has_value());
  assert(resolver.DeviceCount() == 4);
}

} // namespace

int main() {
  TestResolvesSiteAndDeviceFields();
  TestMappedButUnapprovedAndUnmapped();
  TestUnknownSiteFailsInitialLoad();
  TestBrokenReloadKeepsPreviousSnapshot();
  TestChangedFileIsPickedUp();

  std::cout << "fieldwake_unit_registry_lineage_resolver: pass\n";
  return 0;
}
