#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace fieldwake::grpc {

// Admin RPCs report engine exceptions through this; anything without a
// dedicated mapping becomes INTERNAL.

::grpc::Status ToStatus(const std::exception& e);

} // namespace fieldwake::grpc
