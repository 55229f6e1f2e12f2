#pragma once

#include <memory>
#include <string>

#include "internal/store/message_store.hpp"

namespace failover::store {

/*
  Answers, per call, which local stores the node can use.

  Roles change at runtime, so callers must not cache the answers.
*/
class StoreLocator {
 public:
  virtual ~StoreLocator() = default;

  // The store currently acting as master, or nullptr.
  virtual MessageStorePtr PeekMasterStore() const = 0;

  // The local store serving broker_name, or nullptr.
  virtual MessageStorePtr GetStoreByBrokerName(const std::string& broker_name) const = 0;
};

} // namespace failover::store
