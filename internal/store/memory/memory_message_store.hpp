#pragma once

#include <arrow/buffer.h>

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/store/message_store.hpp"

namespace failover::store {

/*
  In-memory message store.

  Each (topic, queue) is an append-only list of encoded message frames.
  Queue offsets start at 0 per queue; the commit-log offset is the running
  byte count across all queues. Reads hand out the stored buffers
  zero-copy and count as outstanding until the batch is released.

  Thread safety:
    - shared reads
    - exclusive appends
*/
class MemoryMessageStore final : public MessageStore {
 public:
  MemoryMessageStore(std::string broker_name, std::string store_host, int32_t queue_count);

  failover::model::PutResult PutMessage(const failover::broker::v1::Message& message) override;

  std::future<failover::model::PutResult> AsyncPutMessage(const failover::broker::v1::Message& message) override;

  std::unique_ptr<ReadBatch> GetMessage(const std::string& group, const std::string& topic, int32_t queue_id, int64_t offset,
                                        int32_t max_count, const std::shared_ptr<MessageFilter>& filter) override;

  const std::string& BrokerName() const override {
    return broker_name_;
  }

  int32_t QueueCount() const {
    return queue_count_;
  }

  int64_t MaxOffset(const std::string& topic, int32_t queue_id) const;

  // Batches handed out by GetMessage and not yet released.
  int64_t OutstandingReads() const {
    return outstanding_reads_->load();
  }

 private:
  using ConsumeQueue = std::vector<std::shared_ptr<arrow::Buffer>>;

  std::string broker_name_;
  std::string store_host_;
  int32_t     queue_count_;

  mutable std::shared_mutex                                  mutex_;
  std::unordered_map<std::string, std::vector<ConsumeQueue>> topics_;
  int64_t                                                    commit_log_offset_ = 0;

  // Shared with release hooks so a batch may outlive the store.
  std::shared_ptr<std::atomic<int64_t>> outstanding_reads_ = std::make_shared<std::atomic<int64_t>>(0);
};

} // namespace failover::store
