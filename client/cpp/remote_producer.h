#pragma once

#include <arrow/result.h>
#include <arrow/status.h>

#include <functional>
#include <string>
#include <vector>

#include "failover/broker/v1/message.pb.h"

namespace failover::client {

// Exactly one of the two is invoked per accepted async send.
struct SendCallback {
  std::function<void(const failover::broker::v1::SendResult&)> on_success;
  std::function<void(const arrow::Status&)>                    on_exception;
};

// Picks the destination among the topic's publish queues.
using MessageQueueSelector = std::function<failover::broker::v1::MessageQueue(
    const std::vector<failover::broker::v1::MessageQueue>& queues, const failover::broker::v1::Message& message, const std::string& arg)>;

/*
  Producer side of a remote broker.

  Errors are reported as arrow::Status; a non-OK status from SendAsync
  means the send was never initiated and the callback will not run.
*/
class RemoteProducer {
 public:
  virtual ~RemoteProducer() = default;

  virtual arrow::Status Start(const std::string& namesrv_addr) = 0;
  virtual void          Shutdown()                             = 0;

  virtual arrow::Result<failover::broker::v1::SendResult> Send(const failover::broker::v1::Message& message) = 0;

  virtual arrow::Status SendAsync(const failover::broker::v1::Message& message, SendCallback callback) = 0;

  virtual arrow::Result<failover::broker::v1::SendResult> Send(const failover::broker::v1::Message& message,
                                                               const MessageQueueSelector& selector, const std::string& arg) = 0;

  virtual const std::string& group() const = 0;
};

} // namespace failover::client
