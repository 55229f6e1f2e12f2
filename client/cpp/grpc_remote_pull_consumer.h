#pragma once

#include <memory>
#include <string>

#include "client/cpp/broker_stub_pool.h"
#include "client/cpp/client_options.h"
#include "client/cpp/remote_pull_consumer.h"
#include "client/cpp/route_client.h"

namespace failover::client {

class GrpcRemotePullConsumer final : public RemotePullConsumer {
 public:
  GrpcRemotePullConsumer(std::string group, RemoteClientOptions options);
  ~GrpcRemotePullConsumer() override;

  arrow::Status Start(const std::string& namesrv_addr) override;
  void          Shutdown() override;

  arrow::Result<failover::broker::v1::PullResult> Pull(const failover::broker::v1::MessageQueue& queue, const std::string& sub_expression,
                                                       int64_t offset, int32_t max_nums) override;

  const std::string& group() const override {
    return group_;
  }

 private:
  std::string                  group_;
  RemoteClientOptions          options_;
  std::unique_ptr<RouteClient> routes_;
  BrokerStubPool               stubs_;
};

} // namespace failover::client
