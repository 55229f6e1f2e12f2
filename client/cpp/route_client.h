#pragma once

#include <arrow/result.h>
#include <arrow/status.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "failover/broker/services/v1/route_service.grpc.pb.h"
#include "failover/broker/v1/message.pb.h"
#include "failover/broker/v1/route.pb.h"

namespace failover::client {

// Splits "host:port;host:port", dropping empty entries and whitespace.
std::vector<std::string> SplitNameServerList(const std::string& namesrv_addr);

/*
  Resolves topic routes through the name service.

  Name servers are asked in list order; the first one that answers wins.
*/
class RouteClient {
 public:
  static arrow::Result<std::unique_ptr<RouteClient>> Connect(const std::string& namesrv_addr, std::chrono::milliseconds timeout);

  arrow::Result<failover::broker::v1::TopicRoute> GetTopicRoute(const std::string& topic) const;

  // One queue per write queue of every broker in the route.
  static std::vector<failover::broker::v1::MessageQueue> PublishQueues(const failover::broker::v1::TopicRoute& route);

  // Master address of broker_name; any replica when require_master is false
  // and the master is missing.
  static arrow::Result<std::string> BrokerAddress(const failover::broker::v1::TopicRoute& route, const std::string& broker_name,
                                                  bool require_master);

  const std::vector<std::string>& addresses() const {
    return addresses_;
  }

 private:
  RouteClient(std::vector<std::string> addresses, std::chrono::milliseconds timeout);

  std::vector<std::string>                                                     addresses_;
  std::vector<std::unique_ptr<failover::broker::services::v1::RouteService::Stub>> stubs_;
  std::chrono::milliseconds                                                    timeout_;
};

} // namespace failover::client
