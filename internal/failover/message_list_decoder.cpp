#include "message_list_decoder.hpp"

#include "internal/codec/message_codec.hpp"
#include "internal/observability/logging.hpp"

namespace failover::bridge {

using failover::broker::v1::Message;
using failover::observability::IntField;
using failover::observability::StringField;

namespace {

class BatchReleaseGuard {
 public:
  explicit BatchReleaseGuard(failover::store::ReadBatch& batch) : batch_(batch) {
  }
  ~BatchReleaseGuard() {
    batch_.Release();
  }

  BatchReleaseGuard(const BatchReleaseGuard&)            = delete;
  BatchReleaseGuard& operator=(const BatchReleaseGuard&) = delete;

 private:
  failover::store::ReadBatch& batch_;
};

} // namespace

std::vector<Message> DecodeMessageList(failover::store::ReadBatch& batch) {
  return DecodeMessageList(batch, [](const arrow::Buffer& buffer) { return failover::codec::DecodeMessage(buffer); });
}

std::vector<Message> DecodeMessageList(failover::store::ReadBatch& batch, const MessageDecoder& decoder) {
  BatchReleaseGuard guard(batch);

  std::vector<Message> found;
  const auto&          buffers = batch.buffers();
  const auto&          offsets = batch.queue_offsets();
  found.reserve(buffers.size());

  for (size_t i = 0; i < buffers.size(); ++i) {
    const auto& buffer = buffers[i];
    if (!buffer) {
      FAILOVER_LOG_ERROR("read batch buffer is null",
                         {IntField("index", static_cast<int64_t>(i)), StringField("status", failover::store::ToString(batch.status()))});
      continue;
    }

    auto message = decoder(*buffer);
    if (!message) {
      FAILOVER_LOG_ERROR("decoded message is null",
                         {IntField("index", static_cast<int64_t>(i)), IntField("queue_offset", offsets[i])});
      continue;
    }

    // consume-queue offset wins over the offset inside the frame
    message->set_queue_offset(offsets[i]);
    found.push_back(std::move(*message));
  }

  return found;
}

} // namespace failover::bridge
