#pragma once

#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/store/store_locator.hpp"

namespace failover::store {

/*
  StoreLocator backed by a name -> store table plus an optional master
  designation.

  Thread safety:
    - shared lookups
    - exclusive role changes
*/
class StoreRegistry final : public StoreLocator {
 public:
  MessageStorePtr PeekMasterStore() const override;
  MessageStorePtr GetStoreByBrokerName(const std::string& broker_name) const override;

  void RegisterStore(MessageStorePtr store);
  void UnregisterStore(const std::string& broker_name);

  // Throws NotFound when broker_name has no registered store.
  void SetMaster(const std::string& broker_name);
  void ClearMaster();

 private:
  mutable std::shared_mutex                        mutex_;
  std::unordered_map<std::string, MessageStorePtr> stores_;
  std::string                                      master_name_;
};

} // namespace failover::store
