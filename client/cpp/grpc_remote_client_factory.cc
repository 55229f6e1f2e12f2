#include "client/cpp/grpc_remote_client_factory.h"

#include "client/cpp/grpc_remote_producer.h"
#include "client/cpp/grpc_remote_pull_consumer.h"

namespace failover::client {

std::unique_ptr<RemoteProducer> GrpcRemoteClientFactory::CreateProducer(const std::string& group) {
  return std::make_unique<GrpcRemoteProducer>(group, options_);
}

std::unique_ptr<RemotePullConsumer> GrpcRemoteClientFactory::CreatePullConsumer(const std::string& group) {
  return std::make_unique<GrpcRemotePullConsumer>(group, options_);
}

} // namespace failover::client
