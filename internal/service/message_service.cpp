#include "message_service.hpp"

#include <stdexcept>
#include <string>

#include "internal/failover/escape_bridge.hpp"
#include "internal/failover/message_list_decoder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/message_filter.hpp"
#include "internal/store/store_locator.hpp"
#include "internal/util/errors.hpp"

namespace failover::service {

using namespace failover::broker::services::v1;
using failover::broker::v1::PullStatus;
using failover::broker::v1::SendStatus;
using failover::model::PutStatus;
using failover::observability::IntField;
using failover::observability::StringField;
using failover::store::GetMessageStatus;

namespace {

constexpr int32_t kDefaultPullBatchSize = 32;

SendStatus ToSendStatus(const failover::model::PutResult& result) {
  switch (result.status()) {
    case PutStatus::kOk:
      return failover::broker::v1::SEND_STATUS_SEND_OK;
    case PutStatus::kSlaveNotAvailable:
      return failover::broker::v1::SEND_STATUS_SLAVE_NOT_AVAILABLE;
    case PutStatus::kFlushDiskTimeout:
      return failover::broker::v1::SEND_STATUS_FLUSH_DISK_TIMEOUT;
    case PutStatus::kFlushReplicaTimeout:
      return failover::broker::v1::SEND_STATUS_FLUSH_SLAVE_TIMEOUT;
    case PutStatus::kServiceNotAvailable:
    case PutStatus::kRemoteSendFailed:
      throw failover::util::ServiceUnavailable("put message failed: " + std::string(failover::model::ToString(result.status())));
    case PutStatus::kMessageIllegal:
      throw failover::util::InvalidArgument("put message failed: message illegal");
    default:
      throw std::runtime_error("put message failed: " + std::string(failover::model::ToString(result.status())));
  }
}

PullStatus ToPullStatus(GetMessageStatus status, bool found_any) {
  switch (status) {
    case GetMessageStatus::kFound:
      return found_any ? failover::broker::v1::PULL_STATUS_FOUND : failover::broker::v1::PULL_STATUS_NO_MATCHED_MSG;
    case GetMessageStatus::kNoMatchedMessage:
      return failover::broker::v1::PULL_STATUS_NO_MATCHED_MSG;
    case GetMessageStatus::kNoMessageInQueue:
    case GetMessageStatus::kOffsetOverflowOne:
      return failover::broker::v1::PULL_STATUS_NO_NEW_MSG;
    case GetMessageStatus::kOffsetTooSmall:
    case GetMessageStatus::kOffsetOverflowBadly:
    case GetMessageStatus::kNoMatchedLogicQueue:
    default:
      return failover::broker::v1::PULL_STATUS_OFFSET_ILLEGAL;
  }
}

} // namespace

MessageService::MessageService(ServiceContext ctx) : ctx_(std::move(ctx)) {}

SendMessageResponse MessageService::SendMessage(const SendMessageRequest& req) {
  if (req.message().topic().empty()) {
    throw failover::util::InvalidArgument("send message: topic is required");
  }
  if (req.has_queue() && !req.queue().topic().empty() && req.queue().topic() != req.message().topic()) {
    throw failover::util::InvalidArgument("send message: queue topic does not match message topic");
  }

  auto message = req.message();
  if (req.has_queue()) {
    message.set_queue_id(req.queue().queue_id());
  }

  const auto result = ctx_.bridge->PutMessage(message);

  SendMessageResponse resp;
  auto* send_result = resp.mutable_result();
  send_result->set_send_status(ToSendStatus(result));
  *send_result->mutable_message_queue() = req.queue();
  if (result.append_result()) {
    send_result->set_msg_id(result.append_result()->msg_id);
    send_result->set_queue_offset(result.append_result()->queue_offset);
  }
  return resp;
}

PullMessageResponse MessageService::PullMessage(const PullMessageRequest& req) {
  const auto& queue = req.queue();
  auto store = ctx_.stores->GetStoreByBrokerName(queue.broker_name());
  if (!store) {
    throw failover::util::NotFound("pull message: broker " + queue.broker_name() + " is not served by this node");
  }

  const int32_t max_nums = req.max_nums() > 0 ? req.max_nums() : kDefaultPullBatchSize;
  auto batch = store->GetMessage(req.consumer_group(), queue.topic(), queue.queue_id(), req.offset(), max_nums,
                                 failover::store::MakeTagFilter(req.sub_expression()));
  if (!batch) {
    throw std::runtime_error("pull message: store returned no result");
  }

  const auto status            = batch->status();
  const auto next_begin_offset = batch->next_begin_offset();
  const auto min_offset        = batch->min_offset();
  const auto max_offset        = batch->max_offset();
  auto       found             = failover::bridge::DecodeMessageList(*batch);

  PullMessageResponse resp;
  auto* result = resp.mutable_result();
  result->set_pull_status(ToPullStatus(status, !found.empty()));
  result->set_next_begin_offset(next_begin_offset);
  result->set_min_offset(min_offset);
  result->set_max_offset(max_offset);
  for (auto& message : found) {
    *result->add_msg_found_list() = std::move(message);
  }

  if (result->pull_status() == failover::broker::v1::PULL_STATUS_OFFSET_ILLEGAL) {
    FAILOVER_LOG_WARN("pull offset illegal", {StringField("topic", queue.topic()), IntField("queue_id", queue.queue_id()),
                                              IntField("offset", req.offset()), StringField("status", failover::store::ToString(status))});
  }
  return resp;
}

}
