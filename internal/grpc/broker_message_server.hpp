#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "failover/broker/v1.hpp"
#include "internal/service/message_service.hpp"

namespace failover::grpc {

class BrokerMessageServer final : public failover::broker::v1::BrokerMessageService::Service {
public:
  explicit BrokerMessageServer(std::shared_ptr<failover::service::MessageService> svc);

  ::grpc::Status SendMessage(::grpc::ServerContext*,
                             const failover::broker::v1::SendMessageRequest*,
                             failover::broker::v1::SendMessageResponse*) override;

  ::grpc::Status PullMessage(::grpc::ServerContext*,
                             const failover::broker::v1::PullMessageRequest*,
                             failover::broker::v1::PullMessageResponse*) override;

private:
  std::shared_ptr<failover::service::MessageService> service_;
};

} // namespace failover::grpc
