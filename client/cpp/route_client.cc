#include "client/cpp/route_client.h"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <algorithm>
#include <cctype>

#include "client/cpp/grpc_status_util.h"

namespace failover::client {

using failover::broker::services::v1::GetTopicRouteRequest;
using failover::broker::services::v1::GetTopicRouteResponse;
using failover::broker::services::v1::RouteService;
using failover::broker::v1::MessageQueue;
using failover::broker::v1::TopicRoute;

std::vector<std::string> SplitNameServerList(const std::string& namesrv_addr) {
  std::vector<std::string> addresses;
  std::string              current;
  auto flush = [&]() {
    if (!current.empty()) {
      addresses.push_back(current);
      current.clear();
    }
  };
  for (char c : namesrv_addr) {
    if (c == ';') {
      flush();
    } else if (!std::isspace(static_cast<unsigned char>(c))) {
      current.push_back(c);
    }
  }
  flush();
  return addresses;
}

arrow::Result<std::unique_ptr<RouteClient>> RouteClient::Connect(const std::string& namesrv_addr, std::chrono::milliseconds timeout) {
  auto addresses = SplitNameServerList(namesrv_addr);
  if (addresses.empty()) {
    return arrow::Status::Invalid("name server address list is empty");
  }
  return std::unique_ptr<RouteClient>(new RouteClient(std::move(addresses), timeout));
}

RouteClient::RouteClient(std::vector<std::string> addresses, std::chrono::milliseconds timeout)
    : addresses_(std::move(addresses)), timeout_(timeout) {
  stubs_.reserve(addresses_.size());
  for (const auto& address : addresses_) {
    stubs_.push_back(RouteService::NewStub(::grpc::CreateChannel(address, ::grpc::InsecureChannelCredentials())));
  }
}

arrow::Result<TopicRoute> RouteClient::GetTopicRoute(const std::string& topic) const {
  GetTopicRouteRequest request;
  request.set_topic(topic);

  arrow::Status last_error = arrow::Status::IOError("no name server reachable");
  for (size_t i = 0; i < stubs_.size(); ++i) {
    GetTopicRouteResponse response;
    ::grpc::ClientContext ctx;
    ctx.set_deadline(std::chrono::system_clock::now() + timeout_);

    const auto status = stubs_[i]->GetTopicRoute(&ctx, request, &response);
    if (status.ok()) {
      return response.route();
    }
    // an authoritative "no such topic" does not improve on another name server
    if (status.error_code() == ::grpc::StatusCode::NOT_FOUND) {
      return GrpcToArrow(status, "GetTopicRoute " + topic);
    }
    last_error = GrpcToArrow(status, "GetTopicRoute " + topic + " via " + addresses_[i]);
  }
  return last_error;
}

std::vector<MessageQueue> RouteClient::PublishQueues(const TopicRoute& route) {
  std::vector<MessageQueue> queues;
  for (const auto& queue_data : route.queue_datas()) {
    for (int32_t i = 0; i < queue_data.write_queue_nums(); ++i) {
      MessageQueue queue;
      queue.set_topic(route.topic());
      queue.set_broker_name(queue_data.broker_name());
      queue.set_queue_id(i);
      queues.push_back(std::move(queue));
    }
  }
  return queues;
}

arrow::Result<std::string> RouteClient::BrokerAddress(const TopicRoute& route, const std::string& broker_name, bool require_master) {
  for (const auto& broker : route.broker_datas()) {
    if (broker.broker_name() != broker_name) {
      continue;
    }
    const auto& addrs  = broker.broker_addrs();
    auto        master = addrs.find(0);
    if (master != addrs.end()) {
      return master->second;
    }
    if (require_master || addrs.empty()) {
      break;
    }
    auto lowest = std::min_element(addrs.begin(), addrs.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
    return lowest->second;
  }
  return arrow::Status::KeyError("no ", require_master ? "master " : "", "address for broker ", broker_name, " in route of topic ",
                                 route.topic());
}

} // namespace failover::client
