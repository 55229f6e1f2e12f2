#pragma once

#include <arrow/result.h>
#include <arrow/status.h>

#include <cstdint>
#include <string>

#include "failover/broker/v1/message.pb.h"

namespace failover::client {

/*
  Pull consumer of a remote broker.
*/
class RemotePullConsumer {
 public:
  virtual ~RemotePullConsumer() = default;

  virtual arrow::Status Start(const std::string& namesrv_addr) = 0;
  virtual void          Shutdown()                             = 0;

  virtual arrow::Result<failover::broker::v1::PullResult> Pull(const failover::broker::v1::MessageQueue& queue,
                                                               const std::string& sub_expression, int64_t offset, int32_t max_nums) = 0;

  virtual const std::string& group() const = 0;
};

} // namespace failover::client
