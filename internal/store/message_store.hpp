#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include "failover/broker/v1/message.pb.h"
#include "internal/model/put_result.hpp"
#include "internal/store/message_filter.hpp"
#include "internal/store/read_batch.hpp"

namespace failover::store {

/*
  Local message store boundary.

  The escape bridge forwards writes to the store currently acting as
  master and reads from whichever store serves the requested broker name.
*/
class MessageStore {
 public:
  virtual ~MessageStore() = default;

  virtual failover::model::PutResult PutMessage(const failover::broker::v1::Message& message) = 0;

  virtual std::future<failover::model::PutResult> AsyncPutMessage(const failover::broker::v1::Message& message) = 0;

  /*
    Read up to max_count messages starting at offset.

    Never returns an empty pointer for a known store; the status tells
    why a batch holds no buffers. Callers must Release() the batch.
  */
  virtual std::unique_ptr<ReadBatch> GetMessage(const std::string& group, const std::string& topic, int32_t queue_id, int64_t offset,
                                                int32_t max_count, const std::shared_ptr<MessageFilter>& filter) = 0;

  virtual const std::string& BrokerName() const = 0;
};

using MessageStorePtr = std::shared_ptr<MessageStore>;

} // namespace failover::store
