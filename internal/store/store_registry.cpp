#include "store_registry.hpp"

#include <mutex>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace failover::store {

using failover::observability::StringField;

MessageStorePtr StoreRegistry::PeekMasterStore() const {
  std::shared_lock lock(mutex_);
  if (master_name_.empty()) {
    return nullptr;
  }
  auto it = stores_.find(master_name_);
  return it == stores_.end() ? nullptr : it->second;
}

MessageStorePtr StoreRegistry::GetStoreByBrokerName(const std::string& broker_name) const {
  std::shared_lock lock(mutex_);
  auto it = stores_.find(broker_name);
  return it == stores_.end() ? nullptr : it->second;
}

void StoreRegistry::RegisterStore(MessageStorePtr store) {
  if (!store) {
    throw std::invalid_argument("cannot register a null store");
  }
  std::unique_lock lock(mutex_);
  stores_[store->BrokerName()] = std::move(store);
}

void StoreRegistry::UnregisterStore(const std::string& broker_name) {
  std::unique_lock lock(mutex_);
  stores_.erase(broker_name);
  if (master_name_ == broker_name) {
    master_name_.clear();
  }
}

void StoreRegistry::SetMaster(const std::string& broker_name) {
  {
    std::unique_lock lock(mutex_);
    if (stores_.find(broker_name) == stores_.end()) {
      throw failover::util::NotFound("no local store for broker " + broker_name);
    }
    master_name_ = broker_name;
  }
  FAILOVER_LOG_INFO("master store designated", {StringField("broker_name", broker_name)});
}

void StoreRegistry::ClearMaster() {
  std::string previous;
  {
    std::unique_lock lock(mutex_);
    previous.swap(master_name_);
  }
  if (!previous.empty()) {
    FAILOVER_LOG_INFO("master store cleared", {StringField("broker_name", previous)});
  }
}

} // namespace failover::store
