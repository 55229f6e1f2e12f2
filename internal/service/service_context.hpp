#pragma once

#include <memory>

#include "config/config.pb.h"

namespace failover::bridge { class EscapeBridge; }
namespace failover::store { class StoreLocator; }

namespace failover::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<failover::bridge::EscapeBridge> bridge;
  std::shared_ptr<failover::store::StoreLocator> stores;
  failover::runtime::config::RouteTableConfig route_table;
};

}
