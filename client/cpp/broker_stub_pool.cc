#include "client/cpp/broker_stub_pool.h"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

namespace failover::client {

std::shared_ptr<BrokerStubPool::Stub> BrokerStubPool::Get(const std::string& address) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto&                       stub = stubs_[address];
  if (!stub) {
    stub = failover::broker::services::v1::BrokerMessageService::NewStub(::grpc::CreateChannel(address, ::grpc::InsecureChannelCredentials()));
  }
  return stub;
}

void BrokerStubPool::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  stubs_.clear();
}

} // namespace failover::client
