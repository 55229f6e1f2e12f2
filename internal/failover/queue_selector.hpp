#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "client/cpp/remote_producer.h"
#include "failover/broker/v1/message.pb.h"

namespace failover::bridge {

// 31-multiplier string hash over the key's bytes in 32-bit arithmetic.
// Stable across processes, so re-forwarding a message picks the same queue.
int32_t RoutingHash(std::string_view key);

/*
  Index of the queue for routing_key among queue_count queues.

  The hash magnitude is taken unsigned, so the result is in
  [0, queue_count) even for INT32_MIN. queue_count must be positive.
*/
size_t SelectQueueIndex(std::string_view routing_key, size_t queue_count);

// topic + store host.
std::string RoutingKey(const failover::broker::v1::Message& message);

// Selector for RemoteProducer::Send that uses its arg as the routing key.
failover::client::MessageQueueSelector HashQueueSelector();

} // namespace failover::bridge
