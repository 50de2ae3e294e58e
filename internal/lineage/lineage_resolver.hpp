#pragma once

#include <optional>
#include <string>

namespace fieldwake::lineage {

/*
  Where a device sits in the ownership hierarchy, plus the scheduling
  inputs that come with it.

  mapped   : the device is assigned to a site
  approved : provisioning finished; unapproved devices only get sleep
*/
struct DeviceLineage {
  std::string device_id;

  std::string site_id;
  std::string site_name;
  std::string program_id;
  std::string company_id;

  std::string timezone;
  std::string device_schedule;
  std::string site_schedule;

  bool mapped   = false;
  bool approved = false;
};

class LineageResolver {
 public:
  virtual ~LineageResolver() = default;

  // nullopt when the device is unknown to the registry
  virtual std::optional<DeviceLineage> Resolve(const std::string& device_id) = 0;
};

} // namespace fieldwake::lineage
