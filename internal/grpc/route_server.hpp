#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "failover/broker/v1.hpp"
#include "internal/service/route_service.hpp"

namespace failover::grpc {

class RouteServer final : public failover::broker::v1::RouteService::Service {
public:
  explicit RouteServer(std::shared_ptr<failover::service::RouteService> svc);

  ::grpc::Status GetTopicRoute(::grpc::ServerContext*,
                               const failover::broker::v1::GetTopicRouteRequest*,
                               failover::broker::v1::GetTopicRouteResponse*) override;

private:
  std::shared_ptr<failover::service::RouteService> service_;
};

} // namespace failover::grpc
