#include "route_service.hpp"

#include <unordered_set>

#include "internal/util/errors.hpp"

namespace failover::service {

using namespace failover::broker::services::v1;

RouteService::RouteService(ServiceContext ctx) : ctx_(std::move(ctx)) {}

GetTopicRouteResponse RouteService::GetTopicRoute(const GetTopicRouteRequest& req) {
  if (req.topic().empty()) {
    throw failover::util::InvalidArgument("get topic route: topic is required");
  }

  GetTopicRouteResponse resp;
  auto* route = resp.mutable_route();
  route->set_topic(req.topic());

  std::unordered_set<std::string> broker_names;
  for (const auto& topic : ctx_.route_table.topics()) {
    if (topic.topic() != req.topic()) {
      continue;
    }
    auto* queue_data = route->add_queue_datas();
    queue_data->set_broker_name(topic.broker_name());
    queue_data->set_write_queue_nums(topic.queue_count());
    queue_data->set_read_queue_nums(topic.queue_count());
    broker_names.insert(topic.broker_name());
  }

  if (broker_names.empty()) {
    throw failover::util::NotFound("no route for topic " + req.topic());
  }

  for (const auto& name : broker_names) {
    failover::broker::v1::BrokerData* broker_data = nullptr;
    for (const auto& broker : ctx_.route_table.brokers()) {
      if (broker.broker_name() != name) {
        continue;
      }
      if (!broker_data) {
        broker_data = route->add_broker_datas();
        broker_data->set_broker_name(name);
      }
      (*broker_data->mutable_broker_addrs())[broker.broker_id()] = broker.address();
    }
  }

  return resp;
}

}
