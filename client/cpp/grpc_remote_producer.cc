#include "client/cpp/grpc_remote_producer.h"

#include <grpcpp/client_context.h>

#include <chrono>
#include <utility>

#include "client/cpp/grpc_status_util.h"

namespace failover::client {

using failover::broker::services::v1::SendMessageRequest;
using failover::broker::services::v1::SendMessageResponse;
using failover::broker::v1::Message;
using failover::broker::v1::SendResult;

namespace {

// Keeps request, response and context alive until the callback runs.
struct AsyncSendCall {
  ::grpc::ClientContext                 ctx;
  SendMessageRequest                    request;
  SendMessageResponse                   response;
  SendCallback                          callback;
  std::shared_ptr<BrokerStubPool::Stub> stub;
};

} // namespace

GrpcRemoteProducer::GrpcRemoteProducer(std::string group, RemoteClientOptions options)
    : group_(std::move(group)), options_(options) {
}

GrpcRemoteProducer::~GrpcRemoteProducer() {
  Shutdown();
}

arrow::Status GrpcRemoteProducer::Start(const std::string& namesrv_addr) {
  if (routes_) {
    return arrow::Status::Invalid("producer ", group_, " already started");
  }
  ARROW_ASSIGN_OR_RAISE(routes_, RouteClient::Connect(namesrv_addr, options_.route_timeout));
  return arrow::Status::OK();
}

void GrpcRemoteProducer::Shutdown() {
  routes_.reset();
  stubs_.Clear();
}

arrow::Result<GrpcRemoteProducer::SendTarget> GrpcRemoteProducer::SelectTarget(const Message& message, const MessageQueueSelector* selector,
                                                                                const std::string& arg) {
  if (!routes_) {
    return arrow::Status::Invalid("producer ", group_, " not started");
  }

  ARROW_ASSIGN_OR_RAISE(auto route, routes_->GetTopicRoute(message.topic()));
  const auto queues = RouteClient::PublishQueues(route);
  if (queues.empty()) {
    return arrow::Status::IOError("no publish queue for topic ", message.topic());
  }

  SendTarget target;
  if (selector) {
    target.queue = (*selector)(queues, message, arg);
  } else {
    target.queue = queues[send_index_.fetch_add(1) % queues.size()];
  }

  ARROW_ASSIGN_OR_RAISE(auto address, RouteClient::BrokerAddress(route, target.queue.broker_name(), /*require_master=*/true));
  target.stub = stubs_.Get(address);
  return target;
}

arrow::Result<SendResult> GrpcRemoteProducer::SendTo(const SendTarget& target, const Message& message) {
  SendMessageRequest request;
  *request.mutable_message() = message;
  *request.mutable_queue()   = target.queue;
  request.set_producer_group(group_);

  SendMessageResponse response;
  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + options_.send_timeout);

  ARROW_RETURN_NOT_OK(GrpcToArrow(target.stub->SendMessage(&ctx, request, &response), "SendMessage"));
  return response.result();
}

arrow::Result<SendResult> GrpcRemoteProducer::Send(const Message& message) {
  ARROW_ASSIGN_OR_RAISE(auto target, SelectTarget(message, nullptr, {}));
  return SendTo(target, message);
}

arrow::Result<SendResult> GrpcRemoteProducer::Send(const Message& message, const MessageQueueSelector& selector, const std::string& arg) {
  ARROW_ASSIGN_OR_RAISE(auto target, SelectTarget(message, &selector, arg));
  return SendTo(target, message);
}

arrow::Status GrpcRemoteProducer::SendAsync(const Message& message, SendCallback callback) {
  ARROW_ASSIGN_OR_RAISE(auto target, SelectTarget(message, nullptr, {}));

  auto call = std::make_shared<AsyncSendCall>();
  *call->request.mutable_message() = message;
  *call->request.mutable_queue()   = target.queue;
  call->request.set_producer_group(group_);
  call->callback = std::move(callback);
  call->stub     = target.stub;
  call->ctx.set_deadline(std::chrono::system_clock::now() + options_.send_timeout);

  call->stub->async()->SendMessage(&call->ctx, &call->request, &call->response, [call](::grpc::Status status) {
    if (status.ok()) {
      if (call->callback.on_success) call->callback.on_success(call->response.result());
      return;
    }
    if (call->callback.on_exception) call->callback.on_exception(GrpcToArrow(status, "SendMessage"));
  });
  return arrow::Status::OK();
}

} // namespace failover::client
