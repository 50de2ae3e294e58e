#pragma once

#include <string>

#include "internal/core/engine_context.hpp"

namespace fieldwake::core {

// Publishes one targeted missing-fragment request for a receiving transfer
// and counts it against max_missing_requests. The caller holds the device
// lock. Returns false when nothing was sent: transfer gone, not receiving,
// nothing missing, or the request budget is spent.
bool RequestMissingFragments(const EngineContext& ctx, const std::string& device_id, const std::string& artifact_name);

} // namespace fieldwake::core
