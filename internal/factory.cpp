#include "factory.hpp"

#include <chrono>
#include <memory>

#include "client/cpp/grpc_remote_client_factory.h"
#include "internal/failover/escape_bridge.hpp"
#include "internal/grpc/broker_message_server.hpp"
#include "internal/grpc/route_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/message_service.hpp"
#include "internal/service/route_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/memory/memory_message_store.hpp"
#include "internal/store/store_registry.hpp"

namespace failover::factory {

using failover::observability::BoolField;
using failover::observability::IntField;
using failover::observability::StringField;

namespace {

failover::client::RemoteClientOptions BuildClientOptions(const failover::runtime::config::RemoteClientConfig& config) {
  failover::client::RemoteClientOptions options;
  if (config.send_timeout_ms() > 0) {
    options.send_timeout = std::chrono::milliseconds(config.send_timeout_ms());
    options.route_timeout = options.send_timeout;
  }
  if (config.pull_timeout_ms() > 0) {
    options.pull_timeout = std::chrono::milliseconds(config.pull_timeout_ms());
  }
  return options;
}

} // namespace

Application Build(const failover::runtime::config::RuntimeConfig& config) {
  Application app;
  const auto& broker = config.broker();

  // ------------------------------------------------------------------
  // Local store and role
  // ------------------------------------------------------------------
  auto local_store = std::make_shared<store::MemoryMessageStore>(broker.broker_name(), broker.store_host(), broker.queue_count());

  app.stores = std::make_shared<store::StoreRegistry>();
  app.stores->RegisterStore(local_store);
  if (broker.broker_id() == 0) {
    app.stores->SetMaster(broker.broker_name());
  }

  // ------------------------------------------------------------------
  // Escape bridge
  // ------------------------------------------------------------------
  auto clients = std::make_shared<client::GrpcRemoteClientFactory>(BuildClientOptions(config.remote_client()));
  app.bridge   = std::make_shared<bridge::EscapeBridge>(broker, app.stores, std::move(clients));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.bridge      = app.bridge;
  ctx.stores      = app.stores;
  ctx.route_table = config.route_table();

  auto message_service = std::make_shared<service::MessageService>(ctx);
  auto route_service   = std::make_shared<service::RouteService>(ctx);

  app.grpc_services.push_back(std::make_unique<grpc::BrokerMessageServer>(message_service));
  app.grpc_services.push_back(std::make_unique<grpc::RouteServer>(route_service));

  FAILOVER_LOG_INFO("broker node assembled", {StringField("broker_name", broker.broker_name()), IntField("broker_id", broker.broker_id()),
                                              IntField("queue_count", broker.queue_count()),
                                              BoolField("enable_slave_acting_master", broker.enable_slave_acting_master()),
                                              BoolField("enable_remote_escape", broker.enable_remote_escape())});
  return app;
}

} // namespace failover::factory
