#pragma once

#include "fieldwake/core/v1/types.pb.h"
#include "fieldwake/device/v1/directives.pb.h"

#include "fieldwake/services/v1/wake_admin_service.pb.h"
#include "fieldwake/services/v1/wake_ingest_service.pb.h"

#include "fieldwake/services/v1/wake_admin_service.grpc.pb.h"
#include "fieldwake/services/v1/wake_ingest_service.grpc.pb.h"

namespace fieldwake::v1 {
using namespace ::fieldwake::core::v1;
using namespace ::fieldwake::services::v1;
}
