#pragma once

#include "failover/broker/v1/message.pb.h"
#include "failover/broker/v1/route.pb.h"

#include "failover/broker/services/v1/broker_message_service.pb.h"
#include "failover/broker/services/v1/route_service.pb.h"

#include "failover/broker/services/v1/broker_message_service.grpc.pb.h"
#include "failover/broker/services/v1/route_service.grpc.pb.h"

namespace failover::broker::v1 {
using namespace ::failover::broker::services::v1;
}
