#pragma once

#include <string>

namespace fieldwake::util {

// Random RFC4122 version 4 identifier in lowercase 8-4-4-4-12 form.
// Wake events and failure journal rows are keyed by these.
std::string NewUUIDString();

} // namespace fieldwake::util
