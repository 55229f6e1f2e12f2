#pragma once

#include "failover/broker/services/v1/broker_message_service.pb.h"
#include "service_context.hpp"

namespace failover::service {

/*
  Write and read path a node exposes to remote producers and consumers.

  Writes go through the node's escape bridge, so a node without a master
  store forwards them again; reads are served from local stores only.
*/
class MessageService {
public:
  explicit MessageService(ServiceContext ctx);

  failover::broker::services::v1::SendMessageResponse
  SendMessage(const failover::broker::services::v1::SendMessageRequest& req);

  failover::broker::services::v1::PullMessageResponse
  PullMessage(const failover::broker::services::v1::PullMessageRequest& req);

private:
  ServiceContext ctx_;
};

}
