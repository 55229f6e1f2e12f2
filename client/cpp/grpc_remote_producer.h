#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "client/cpp/broker_stub_pool.h"
#include "client/cpp/client_options.h"
#include "client/cpp/remote_producer.h"
#include "client/cpp/route_client.h"

namespace failover::client {

/*
  RemoteProducer over gRPC.

  Each send resolves the topic route, picks a publish queue (round robin,
  or the caller's selector) and sends to that broker's master.
*/
class GrpcRemoteProducer final : public RemoteProducer {
 public:
  GrpcRemoteProducer(std::string group, RemoteClientOptions options);
  ~GrpcRemoteProducer() override;

  arrow::Status Start(const std::string& namesrv_addr) override;
  void          Shutdown() override;

  arrow::Result<failover::broker::v1::SendResult> Send(const failover::broker::v1::Message& message) override;

  arrow::Status SendAsync(const failover::broker::v1::Message& message, SendCallback callback) override;

  arrow::Result<failover::broker::v1::SendResult> Send(const failover::broker::v1::Message& message, const MessageQueueSelector& selector,
                                                       const std::string& arg) override;

  const std::string& group() const override {
    return group_;
  }

 private:
  struct SendTarget {
    failover::broker::v1::MessageQueue       queue;
    std::shared_ptr<BrokerStubPool::Stub>    stub;
  };

  arrow::Result<SendTarget>                        SelectTarget(const failover::broker::v1::Message& message,
                                                                const MessageQueueSelector* selector, const std::string& arg);
  arrow::Result<failover::broker::v1::SendResult> SendTo(const SendTarget& target, const failover::broker::v1::Message& message);

  std::string                  group_;
  RemoteClientOptions          options_;
  std::unique_ptr<RouteClient> routes_;
  BrokerStubPool               stubs_;
  std::atomic<uint32_t>        send_index_{0};
};

} // namespace failover::client
