#include "queue_selector.hpp"

#include <stdexcept>

namespace failover::bridge {

int32_t RoutingHash(std::string_view key) {
  uint32_t hash = 0;
  for (char c : key) {
    hash = 31u * hash + static_cast<uint32_t>(static_cast<unsigned char>(c));
  }
  return static_cast<int32_t>(hash);
}

size_t SelectQueueIndex(std::string_view routing_key, size_t queue_count) {
  if (queue_count == 0) {
    throw std::invalid_argument("cannot select among zero queues");
  }
  const int32_t  hash      = RoutingHash(routing_key);
  const uint32_t magnitude = hash < 0 ? 0u - static_cast<uint32_t>(hash) : static_cast<uint32_t>(hash);
  return static_cast<size_t>(magnitude) % queue_count;
}

std::string RoutingKey(const failover::broker::v1::Message& message) {
  return message.topic() + message.store_host();
}

failover::client::MessageQueueSelector HashQueueSelector() {
  return [](const std::vector<failover::broker::v1::MessageQueue>& queues, const failover::broker::v1::Message&,
            const std::string& arg) { return queues.at(SelectQueueIndex(arg, queues.size())); };
}

} // namespace failover::bridge
