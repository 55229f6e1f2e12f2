#include "route_server.hpp"

#include "grpc_error.hpp"

namespace failover::grpc {

RouteServer::RouteServer(std::shared_ptr<failover::service::RouteService> svc)
    : service_(std::move(svc)) {}

::grpc::Status RouteServer::GetTopicRoute(::grpc::ServerContext*,
                                          const failover::broker::v1::GetTopicRouteRequest* req,
                                          failover::broker::v1::GetTopicRouteResponse* resp) {
  try {
    *resp = service_->GetTopicRoute(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace failover::grpc
