#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"

namespace failover::bridge { class EscapeBridge; }
namespace failover::store { class StoreRegistry; }

namespace failover::factory {

/*
  Application

  Everything one broker node needs for the lifetime of the process.
  The bridge is not started here; the caller starts it once the
  server is ready to accept peer traffic.
*/
struct Application {
  std::shared_ptr<failover::store::StoreRegistry> stores;
  std::shared_ptr<failover::bridge::EscapeBridge> bridge;
  std::vector<std::unique_ptr<::grpc::Service>>   grpc_services;
};

/*
  Build

  Composition root. A broker_id of 0 registers the local store as the
  master; any other id makes the node a slave that can only escape.
*/
Application Build(const failover::runtime::config::RuntimeConfig& config);

} // namespace failover::factory
