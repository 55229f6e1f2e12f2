#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "failover/broker/v1.hpp"
#include "internal/failover/escape_bridge.hpp"
#include "internal/grpc/broker_message_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/route_server.hpp"
#include "internal/service/message_service.hpp"
#include "internal/service/route_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/memory/memory_message_store.hpp"
#include "internal/store/store_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

failover::service::ServiceContext BuildServiceContext(bool master) {
  auto stores = std::make_shared<failover::store::StoreRegistry>();
  stores->RegisterStore(std::make_shared<failover::store::MemoryMessageStore>("broker-a", "10.0.0.1:10911", 4));
  if (master) {
    stores->SetMaster("broker-a");
  }

  failover::runtime::config::BrokerConfig config;
  config.set_broker_name("broker-a");
  config.set_broker_id(master ? 0 : 1);

  failover::service::ServiceContext ctx;
  ctx.stores = stores;
  ctx.bridge = std::make_shared<failover::bridge::EscapeBridge>(config, stores, nullptr);
  ctx.bridge->Start();
  return ctx;
}

void TestExceptionMapping() {
  using failover::grpc::ToStatus;
  assert(ToStatus(failover::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(failover::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(failover::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(failover::util::ConfigurationError("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(failover::util::ServiceUnavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(failover::util::NotFound("missing topic")).error_message() == "missing topic");
}

void TestSendOnSlaveWithoutEscapeReturnsUnavailable() {
  auto service = std::make_shared<failover::service::MessageService>(BuildServiceContext(/*master=*/false));
  failover::grpc::BrokerMessageServer server(service);

  failover::broker::v1::SendMessageRequest req;
  req.mutable_message()->set_topic("orders");
  req.mutable_queue()->set_queue_id(0);
  failover::broker::v1::SendMessageResponse resp;
  ::grpc::ServerContext                     grpc_ctx;

  const auto status = server.SendMessage(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAVAILABLE);
}

void TestSendOnMasterReturnsOk() {
  auto service = std::make_shared<failover::service::MessageService>(BuildServiceContext(/*master=*/true));
  failover::grpc::BrokerMessageServer server(service);

  failover::broker::v1::SendMessageRequest req;
  req.mutable_message()->set_topic("orders");
  req.mutable_queue()->set_queue_id(1);
  failover::broker::v1::SendMessageResponse resp;
  ::grpc::ServerContext                     grpc_ctx;

  const auto status = server.SendMessage(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.result().send_status() == failover::broker::v1::SEND_STATUS_SEND_OK);
}

void TestPullFromUnknownBrokerReturnsNotFound() {
  auto service = std::make_shared<failover::service::MessageService>(BuildServiceContext(/*master=*/true));
  failover::grpc::BrokerMessageServer server(service);

  failover::broker::v1::PullMessageRequest req;
  req.mutable_queue()->set_topic("orders");
  req.mutable_queue()->set_broker_name("broker-z");
  failover::broker::v1::PullMessageResponse resp;
  ::grpc::ServerContext                     grpc_ctx;

  const auto status = server.PullMessage(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestRouteForMissingTopicReturnsNotFound() {
  auto service = std::make_shared<failover::service::RouteService>(failover::service::ServiceContext{});
  failover::grpc::RouteServer server(service);

  failover::broker::v1::GetTopicRouteRequest req;
  req.set_topic("orders");
  failover::broker::v1::GetTopicRouteResponse resp;
  ::grpc::ServerContext                       grpc_ctx;

  const auto status = server.GetTopicRoute(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestSendOnSlaveWithoutEscapeReturnsUnavailable();
  TestSendOnMasterReturnsOk();
  TestPullFromUnknownBrokerReturnsNotFound();
  TestRouteForMissingTopicReturnsNotFound();

  std::cout << "broker_failover_unit_grpc_status: pass\n";
  return 0;
}
