#include "memory_message_store.hpp"

#include <algorithm>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>

#include "internal/codec/message_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace failover::store {

using failover::broker::v1::Message;
using failover::model::AppendResult;
using failover::model::PutResult;
using failover::model::PutStatus;
using failover::observability::IntField;
using failover::observability::StringField;

MemoryMessageStore::MemoryMessageStore(std::string broker_name, std::string store_host, int32_t queue_count)
    : broker_name_(std::move(broker_name)), store_host_(std::move(store_host)), queue_count_(queue_count) {
  if (queue_count_ <= 0) {
    throw std::invalid_argument("memory store needs at least one queue per topic");
  }
}

PutResult MemoryMessageStore::PutMessage(const Message& message) {
  if (message.topic().empty()) {
    FAILOVER_LOG_WARN("put rejected, empty topic", {StringField("broker_name", broker_name_)});
    return PutResult(PutStatus::kMessageIllegal, std::nullopt);
  }
  if (message.queue_id() < 0 || message.queue_id() >= queue_count_) {
    FAILOVER_LOG_WARN("put rejected, queue id out of range",
                      {StringField("topic", message.topic()), IntField("queue_id", message.queue_id()), IntField("queue_count", queue_count_)});
    return PutResult(PutStatus::kMessageIllegal, std::nullopt);
  }

  Message stored = message;
  if (stored.store_host().empty()) {
    stored.set_store_host(store_host_);
  }
  stored.set_broker_name(broker_name_);
  stored.set_store_timestamp_ms(failover::util::NowUnixMillis());

  AppendResult append;
  {
    std::unique_lock lock(mutex_);
    auto& queues = topics_[stored.topic()];
    if (queues.empty()) {
      queues.resize(static_cast<size_t>(queue_count_));
    }
    auto& queue = queues[static_cast<size_t>(stored.queue_id())];

    append.queue_offset      = static_cast<int64_t>(queue.size());
    append.commit_log_offset = commit_log_offset_;
    append.msg_id            = broker_name_ + "-" + std::to_string(commit_log_offset_);

    stored.set_queue_offset(append.queue_offset);
    stored.set_commit_log_offset(append.commit_log_offset);
    stored.set_msg_id(append.msg_id);

    auto frame                 = failover::codec::EncodeMessage(stored);
    append.wrote_bytes         = static_cast<int32_t>(frame->size());
    append.store_timestamp_ms  = stored.store_timestamp_ms();
    commit_log_offset_        += frame->size();
    queue.push_back(std::move(frame));
  }

  return PutResult(PutStatus::kOk, std::move(append));
}

std::future<PutResult> MemoryMessageStore::AsyncPutMessage(const Message& message) {
  std::promise<PutResult> promise;
  promise.set_value(PutMessage(message));
  return promise.get_future();
}

std::unique_ptr<ReadBatch> MemoryMessageStore::GetMessage(const std::string& /*group*/, const std::string& topic, int32_t queue_id,
                                                          int64_t offset, int32_t max_count,
                                                          const std::shared_ptr<MessageFilter>& filter) {
  auto batch = std::make_unique<ReadBatch>();
  batch->set_next_begin_offset(offset);

  std::shared_lock lock(mutex_);
  auto topic_it = topics_.find(topic);
  if (topic_it == topics_.end() || queue_id < 0 || queue_id >= queue_count_) {
    batch->set_status(GetMessageStatus::kNoMatchedLogicQueue);
    return batch;
  }

  const auto& queue = topic_it->second[static_cast<size_t>(queue_id)];
  const auto  max   = static_cast<int64_t>(queue.size());
  batch->set_offset_range(0, max);

  if (max == 0) {
    batch->set_status(GetMessageStatus::kNoMessageInQueue);
    batch->set_next_begin_offset(0);
    return batch;
  }
  if (offset < 0) {
    batch->set_status(GetMessageStatus::kOffsetTooSmall);
    batch->set_next_begin_offset(0);
    return batch;
  }
  if (offset == max) {
    batch->set_status(GetMessageStatus::kOffsetOverflowOne);
    return batch;
  }
  if (offset > max) {
    batch->set_status(GetMessageStatus::kOffsetOverflowBadly);
    batch->set_next_begin_offset(max);
    return batch;
  }

  const int32_t wanted = std::max<int32_t>(max_count, 1);
  int64_t       next   = offset;
  for (; next < max && static_cast<int32_t>(batch->buffers().size()) < wanted; ++next) {
    const auto& frame = queue[static_cast<size_t>(next)];
    if (filter) {
      auto decoded = failover::codec::DecodeMessage(*frame);
      if (!decoded || !filter->IsMatched(*decoded)) {
        continue;
      }
    }
    batch->Add(frame, next);
  }
  batch->set_next_begin_offset(next);
  batch->set_status(batch->buffers().empty() ? GetMessageStatus::kNoMatchedMessage : GetMessageStatus::kFound);

  outstanding_reads_->fetch_add(1);
  batch->SetReleaseHook([outstanding = outstanding_reads_]() { outstanding->fetch_sub(1); });

  return batch;
}

int64_t MemoryMessageStore::MaxOffset(const std::string& topic, int32_t queue_id) const {
  std::shared_lock lock(mutex_);
  auto topic_it = topics_.find(topic);
  if (topic_it == topics_.end() || queue_id < 0 || queue_id >= queue_count_) {
    return 0;
  }
  return static_cast<int64_t>(topic_it->second[static_cast<size_t>(queue_id)].size());
}

} // namespace failover::store
