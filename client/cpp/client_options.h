#pragma once

#include <chrono>

namespace failover::client {

struct RemoteClientOptions {
  std::chrono::milliseconds send_timeout{3000};
  std::chrono::milliseconds pull_timeout{10000};
  // Deadline for name-service route lookups.
  std::chrono::milliseconds route_timeout{3000};
};

} // namespace failover::client
