#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

#include "internal/util/errors.hpp"

namespace settlement::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

// Runs one service call and writes its response, or translates the failure.
template <typename Fn, typename Response>
::grpc::Status Serve(Fn&& fn, Response* resp) {
  try {
    *resp = fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace settlement::grpc
