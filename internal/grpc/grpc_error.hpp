#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace usbforge::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace usbforge::grpc
