#include "put_result_translator.hpp"

namespace failover::bridge {

using failover::model::PutResult;
using failover::model::PutStatus;

namespace {

PutStatus ToPutStatus(failover::broker::v1::SendStatus status) {
  switch (status) {
    case failover::broker::v1::SEND_STATUS_SEND_OK:
      return PutStatus::kOk;
    case failover::broker::v1::SEND_STATUS_SLAVE_NOT_AVAILABLE:
      return PutStatus::kSlaveNotAvailable;
    case failover::broker::v1::SEND_STATUS_FLUSH_DISK_TIMEOUT:
      return PutStatus::kFlushDiskTimeout;
    case failover::broker::v1::SEND_STATUS_FLUSH_SLAVE_TIMEOUT:
      return PutStatus::kFlushReplicaTimeout;
    default:
      return PutStatus::kRemoteSendFailed;
  }
}

} // namespace

PutResult TranslateSendResult(const std::optional<failover::broker::v1::SendResult>& send_result) {
  if (!send_result) {
    return RemoteSendFailed();
  }
  return PutResult(ToPutStatus(send_result->send_status()), std::nullopt, /*remote=*/true);
}

PutResult RemoteSendFailed() {
  return PutResult(PutStatus::kRemoteSendFailed, std::nullopt, /*remote=*/true);
}

} // namespace failover::bridge
