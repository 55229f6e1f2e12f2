#pragma once

#include <cstdint>
#include <string_view>

namespace failover::model {

enum class PutStatus : std::uint8_t {
  kOk = 0,
  kServiceNotAvailable = 1,
  kRemoteSendFailed = 2,
  kSlaveNotAvailable = 3,
  kFlushDiskTimeout = 4,
  kFlushReplicaTimeout = 5,
  kMessageIllegal = 6,
  kUnknownError = 7,
};

constexpr std::string_view ToString(PutStatus status) {
  switch (status) {
    case PutStatus::kOk:
      return "PUT_OK";
    case PutStatus::kServiceNotAvailable:
      return "SERVICE_NOT_AVAILABLE";
    case PutStatus::kRemoteSendFailed:
      return "PUT_TO_REMOTE_BROKER_FAIL";
    case PutStatus::kSlaveNotAvailable:
      return "SLAVE_NOT_AVAILABLE";
    case PutStatus::kFlushDiskTimeout:
      return "FLUSH_DISK_TIMEOUT";
    case PutStatus::kFlushReplicaTimeout:
      return "FLUSH_SLAVE_TIMEOUT";
    case PutStatus::kMessageIllegal:
      return "MESSAGE_ILLEGAL";
    case PutStatus::kUnknownError:
    default:
      return "UNKNOWN_ERROR";
  }
}

}  // namespace failover::model
