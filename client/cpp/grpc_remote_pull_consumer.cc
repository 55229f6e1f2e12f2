#include "client/cpp/grpc_remote_pull_consumer.h"

#include <grpcpp/client_context.h>

#include <chrono>
#include <utility>

#include "client/cpp/grpc_status_util.h"

namespace failover::client {

using failover::broker::services::v1::PullMessageRequest;
using failover::broker::services::v1::PullMessageResponse;
using failover::broker::v1::MessageQueue;
using failover::broker::v1::PullResult;

GrpcRemotePullConsumer::GrpcRemotePullConsumer(std::string group, RemoteClientOptions options)
    : group_(std::move(group)), options_(options) {
}

GrpcRemotePullConsumer::~GrpcRemotePullConsumer() {
  Shutdown();
}

arrow::Status GrpcRemotePullConsumer::Start(const std::string& namesrv_addr) {
  if (routes_) {
    return arrow::Status::Invalid("pull consumer ", group_, " already started");
  }
  ARROW_ASSIGN_OR_RAISE(routes_, RouteClient::Connect(namesrv_addr, options_.route_timeout));
  return arrow::Status::OK();
}

void GrpcRemotePullConsumer::Shutdown() {
  routes_.reset();
  stubs_.Clear();
}

arrow::Result<PullResult> GrpcRemotePullConsumer::Pull(const MessageQueue& queue, const std::string& sub_expression, int64_t offset,
                                                       int32_t max_nums) {
  if (!routes_) {
    return arrow::Status::Invalid("pull consumer ", group_, " not started");
  }

  ARROW_ASSIGN_OR_RAISE(auto route, routes_->GetTopicRoute(queue.topic()));
  ARROW_ASSIGN_OR_RAISE(auto address, RouteClient::BrokerAddress(route, queue.broker_name(), /*require_master=*/false));

  PullMessageRequest request;
  *request.mutable_queue() = queue;
  request.set_consumer_group(group_);
  request.set_sub_expression(sub_expression);
  request.set_offset(offset);
  request.set_max_nums(max_nums);

  PullMessageResponse response;
  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + options_.pull_timeout);

  ARROW_RETURN_NOT_OK(GrpcToArrow(stubs_.Get(address)->PullMessage(&ctx, request, &response), "PullMessage"));
  return response.result();
}

} // namespace failover::client
