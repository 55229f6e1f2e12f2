#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace failover::store {

enum class GetMessageStatus : std::uint8_t {
  kFound = 0,
  kNoMatchedMessage = 1,
  kNoMessageInQueue = 2,
  kOffsetTooSmall = 3,
  kOffsetOverflowOne = 4,
  kOffsetOverflowBadly = 5,
  kNoMatchedLogicQueue = 6,
};

std::string_view ToString(GetMessageStatus status);

/*
  Result of a local store read.

  buffers and queue_offsets are parallel: the store-assigned offset of
  buffers[i] is queue_offsets[i]. A buffer may be null when the store could
  not map the entry.

  The batch pins store resources until Release() is called. Release is
  idempotent; the release hook runs at most once.
*/
class ReadBatch {
 public:
  using ReleaseHook = std::function<void()>;

  ReadBatch() = default;
  explicit ReadBatch(GetMessageStatus status) : status_(status) {
  }
  ~ReadBatch();

  ReadBatch(const ReadBatch&)            = delete;
  ReadBatch& operator=(const ReadBatch&) = delete;

  void Add(std::shared_ptr<arrow::Buffer> buffer, int64_t queue_offset);

  void SetReleaseHook(ReleaseHook hook) {
    release_hook_ = std::move(hook);
  }

  void Release();

  bool released() const {
    return released_;
  }

  GetMessageStatus status() const {
    return status_;
  }
  void set_status(GetMessageStatus status) {
    status_ = status;
  }

  const std::vector<std::shared_ptr<arrow::Buffer>>& buffers() const {
    return buffers_;
  }
  const std::vector<int64_t>& queue_offsets() const {
    return queue_offsets_;
  }

  int64_t next_begin_offset() const {
    return next_begin_offset_;
  }
  void set_next_begin_offset(int64_t offset) {
    next_begin_offset_ = offset;
  }

  int64_t min_offset() const {
    return min_offset_;
  }
  int64_t max_offset() const {
    return max_offset_;
  }
  void set_offset_range(int64_t min_offset, int64_t max_offset) {
    min_offset_ = min_offset;
    max_offset_ = max_offset;
  }

 private:
  GetMessageStatus                            status_ = GetMessageStatus::kNoMessageInQueue;
  int64_t                                     next_begin_offset_ = 0;
  int64_t                                     min_offset_        = 0;
  int64_t                                     max_offset_        = 0;
  std::vector<std::shared_ptr<arrow::Buffer>> buffers_;
  std::vector<int64_t>                        queue_offsets_;
  ReleaseHook                                 release_hook_;
  bool                                        released_ = false;
};

} // namespace failover::store
