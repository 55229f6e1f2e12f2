#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "failover/broker/services/v1/broker_message_service.grpc.pb.h"

namespace failover::client {

/*
  One BrokerMessageService stub per broker address, created on first use.
*/
class BrokerStubPool {
 public:
  using Stub = failover::broker::services::v1::BrokerMessageService::Stub;

  std::shared_ptr<Stub> Get(const std::string& address);
  void                  Clear();

 private:
  std::mutex                                             mutex_;
  std::unordered_map<std::string, std::shared_ptr<Stub>> stubs_;
};

} // namespace failover::client
