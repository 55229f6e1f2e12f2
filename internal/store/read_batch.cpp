#include "read_batch.hpp"

#include "internal/observability/logging.hpp"

namespace failover::store {

std::string_view ToString(GetMessageStatus status) {
  switch (status) {
    case GetMessageStatus::kFound:
      return "FOUND";
    case GetMessageStatus::kNoMatchedMessage:
      return "NO_MATCHED_MESSAGE";
    case GetMessageStatus::kNoMessageInQueue:
      return "NO_MESSAGE_IN_QUEUE";
    case GetMessageStatus::kOffsetTooSmall:
      return "OFFSET_TOO_SMALL";
    case GetMessageStatus::kOffsetOverflowOne:
      return "OFFSET_OVERFLOW_ONE";
    case GetMessageStatus::kOffsetOverflowBadly:
      return "OFFSET_OVERFLOW_BADLY";
    case GetMessageStatus::kNoMatchedLogicQueue:
    default:
      return "NO_MATCHED_LOGIC_QUEUE";
  }
}

ReadBatch::~ReadBatch() {
  if (!released_ && (!buffers_.empty() || release_hook_)) {
    FAILOVER_LOG_WARN("read batch destroyed without release",
                      {failover::observability::IntField("buffers", static_cast<int64_t>(buffers_.size()))});
  }
  Release();
}

void ReadBatch::Add(std::shared_ptr<arrow::Buffer> buffer, int64_t queue_offset) {
  buffers_.push_back(std::move(buffer));
  queue_offsets_.push_back(queue_offset);
}

void ReadBatch::Release() {
  if (released_) {
    return;
  }
  released_ = true;
  buffers_.clear();
  if (release_hook_) {
    auto hook = std::move(release_hook_);
    release_hook_ = nullptr;
    hook();
  }
}

} // namespace failover::store
