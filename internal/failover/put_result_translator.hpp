#pragma once

#include <optional>

#include "failover/broker/v1/message.pb.h"
#include "internal/model/put_result.hpp"

namespace failover::bridge {

/*
  Maps a remote send outcome onto the local put vocabulary.

  Every translated result is marked remote and carries no append info.
  No outcome at all, or a status this node does not know, maps to
  kRemoteSendFailed.
*/
failover::model::PutResult TranslateSendResult(const std::optional<failover::broker::v1::SendResult>& send_result);

failover::model::PutResult RemoteSendFailed();

} // namespace failover::bridge
