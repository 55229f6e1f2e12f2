#pragma once

#include <memory>
#include <string>

#include "client/cpp/remote_producer.h"
#include "client/cpp/remote_pull_consumer.h"

namespace failover::client {

/*
  Creates unstarted remote clients identified by group name.
*/
class RemoteClientFactory {
 public:
  virtual ~RemoteClientFactory() = default;

  virtual std::unique_ptr<RemoteProducer>     CreateProducer(const std::string& group)     = 0;
  virtual std::unique_ptr<RemotePullConsumer> CreatePullConsumer(const std::string& group) = 0;
};

} // namespace failover::client
