#pragma once

#include "client/cpp/client_options.h"
#include "client/cpp/remote_client_factory.h"

namespace failover::client {

class GrpcRemoteClientFactory final : public RemoteClientFactory {
 public:
  explicit GrpcRemoteClientFactory(RemoteClientOptions options) : options_(options) {
  }

  std::unique_ptr<RemoteProducer>     CreateProducer(const std::string& group) override;
  std::unique_ptr<RemotePullConsumer> CreatePullConsumer(const std::string& group) override;

 private:
  RemoteClientOptions options_;
};

} // namespace failover::client
