#pragma once

#include <arrow/status.h>
#include <grpcpp/support/status.h>

#include <string>
#include <string_view>

namespace failover::client {

inline arrow::Status GrpcToArrow(const ::grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  if (status.error_code() == ::grpc::StatusCode::NOT_FOUND) {
    return arrow::Status::KeyError(std::string(action), " failed: ", status.error_message());
  }
  if (status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT) {
    return arrow::Status::Invalid(std::string(action), " failed: ", status.error_message());
  }
  return arrow::Status::IOError(std::string(action), " failed (", static_cast<int>(status.error_code()), "): ", status.error_message());
}

} // namespace failover::client
