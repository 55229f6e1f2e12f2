#pragma once

#include "failover/broker/services/v1/route_service.pb.h"
#include "service_context.hpp"

namespace failover::service {

/*
  Name service backed by the static route table of the node config.
*/
class RouteService {
public:
  explicit RouteService(ServiceContext ctx);

  failover::broker::services::v1::GetTopicRouteResponse
  GetTopicRoute(const failover::broker::services::v1::GetTopicRouteRequest& req);

private:
  ServiceContext ctx_;
};

}
