#include "broker_message_server.hpp"

#include "grpc_error.hpp"

namespace failover::grpc {

BrokerMessageServer::BrokerMessageServer(std::shared_ptr<failover::service::MessageService> svc)
    : service_(std::move(svc)) {}

::grpc::Status BrokerMessageServer::SendMessage(::grpc::ServerContext*,
                                                const failover::broker::v1::SendMessageRequest* req,
                                                failover::broker::v1::SendMessageResponse* resp) {
  try {
    *resp = service_->SendMessage(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BrokerMessageServer::PullMessage(::grpc::ServerContext*,
                                                const failover::broker::v1::PullMessageRequest* req,
                                                failover::broker::v1::PullMessageResponse* resp) {
  try {
    *resp = service_->PullMessage(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace failover::grpc
