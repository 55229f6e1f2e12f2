#include "internal/store/memory/memory_message_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/codec/message_codec.hpp"
#include "internal/store/message_filter.hpp"

namespace {

using failover::broker::v1::Message;
using failover::model::PutStatus;
using failover::store::GetMessageStatus;
using failover::store::MemoryMessageStore;

Message MakeMessage(int32_t queue_id, const std::string& body, const std::string& tags = "") {
  Message message;
  message.set_topic("orders");
  message.set_queue_id(queue_id);
  message.set_body(body);
  message.set_tags(tags);
  return message;
}

void TestAppendAssignsOffsetsAndIdentity() {
  MemoryMessageStore store("broker-a", "10.0.0.1:10911", 4);

  const auto first  = store.PutMessage(MakeMessage(1, "one"));
  const auto second = store.PutMessage(MakeMessage(1, "two"));
  const auto other  = store.PutMessage(MakeMessage(2, "three"));

  assert(first.IsOk() && !first.remote());
  assert(first.append_result()->queue_offset == 0);
  assert(second.append_result()->queue_offset == 1);
  assert(other.append_result()->queue_offset == 0);

  assert(first.append_result()->commit_log_offset == 0);
  assert(second.append_result()->commit_log_offset == first.append_result()->wrote_bytes);
  assert(other.append_result()->commit_log_offset ==
         second.append_result()->commit_log_offset + second.append_result()->wrote_bytes);
  assert(first.append_result()->msg_id == "broker-a-0");
  assert(store.MaxOffset("orders", 1) == 2);
}

void TestIllegalMessagesAreRejected() {
  MemoryMessageStore store("broker-a", "10.0.0.1:10911", 4);

  Message no_topic;
  assert(store.PutMessage(no_topic).status() == PutStatus::kMessageIllegal);
  assert(store.PutMessage(MakeMessage(4, "x")).status() == PutStatus::kMessageIllegal);
  assert(store.PutMessage(MakeMessage(-1, "x")).status() == PutStatus::kMessageIllegal);
}

void TestStoredMessageCarriesBrokerFields() {
  MemoryMessageStore store("broker-a", "10.0.0.1:10911", 4);
  assert(store.PutMessage(MakeMessage(0, "one")).IsOk());

  auto batch = store.GetMessage("group", "orders", 0, 0, 1, nullptr);
  assert(batch->status() == GetMessageStatus::kFound);
  assert(batch->buffers().size() == 1);
  const auto stored = failover::codec::DecodeMessage(*batch->buffers()[0]);
  assert(stored.has_value());
  assert(stored->broker_name() == "broker-a");
  assert(stored->store_host() == "10.0.0.1:10911");
  assert(stored->store_timestamp_ms() > 0);
  assert(stored->msg_id() == "broker-a-0");
  batch->Release();
}

void TestOffsetStatuses() {
  MemoryMessageStore store("broker-a", "10.0.0.1:10911", 4);

  assert(store.GetMessage("g", "orders", 0, 0, 1, nullptr)->status() == GetMessageStatus::kNoMatchedLogicQueue);

  assert(store.PutMessage(MakeMessage(0, "one")).IsOk());
  assert(store.PutMessage(MakeMessage(0, "two")).IsOk());

  assert(store.GetMessage("g", "orders", 1, 0, 1, nullptr)->status() == GetMessageStatus::kNoMessageInQueue);
  assert(store.GetMessage("g", "orders", 9, 0, 1, nullptr)->status() == GetMessageStatus::kNoMatchedLogicQueue);
  assert(store.GetMessage("g", "orders", 0, -1, 1, nullptr)->status() == GetMessageStatus::kOffsetTooSmall);

  auto overflow_one = store.GetMessage("g", "orders", 0, 2, 1, nullptr);
  assert(overflow_one->status() == GetMessageStatus::kOffsetOverflowOne);
  assert(overflow_one->next_begin_offset() == 2);

  auto overflow_badly = store.GetMessage("g", "orders", 0, 7, 1, nullptr);
  assert(overflow_badly->status() == GetMessageStatus::kOffsetOverflowBadly);
  assert(overflow_badly->next_begin_offset() == 2);
  assert(overflow_badly->max_offset() == 2);
}

void TestBatchReadAndRelease() {
  MemoryMessageStore store("broker-a", "10.0.0.1:10911", 4);
  for (int i = 0; i < 5; ++i) {
    assert(store.PutMessage(MakeMessage(0, std::to_string(i))).IsOk());
  }

  auto batch = store.GetMessage("g", "orders", 0, 1, 3, nullptr);
  assert(batch->status() == GetMessageStatus::kFound);
  assert(batch->buffers().size() == 3);
  assert(batch->queue_offsets()[0] == 1);
  assert(batch->queue_offsets()[2] == 3);
  assert(batch->next_begin_offset() == 4);
  assert(store.OutstandingReads() == 1);

  batch->Release();
  batch->Release();
  assert(store.OutstandingReads() == 0);
}

void TestTagFilterSkipsUnmatched() {
  MemoryMessageStore store("broker-a", "10.0.0.1:10911", 4);
  assert(store.PutMessage(MakeMessage(0, "a", "created")).IsOk());
  assert(store.PutMessage(MakeMessage(0, "b", "paid")).IsOk());
  assert(store.PutMessage(MakeMessage(0, "c", "created")).IsOk());

  auto filter = failover::store::MakeTagFilter("paid || shipped");
  auto batch  = store.GetMessage("g", "orders", 0, 0, 32, filter);
  assert(batch->status() == GetMessageStatus::kFound);
  assert(batch->buffers().size() == 1);
  assert(batch->queue_offsets()[0] == 1);
  batch->Release();

  auto none = store.GetMessage("g", "orders", 0, 0, 32, failover::store::MakeTagFilter("refunded"));
  assert(none->status() == GetMessageStatus::kNoMatchedMessage);
  assert(none->next_begin_offset() == 3);
  none->Release();
}

void TestAsyncPutIsReady() {
  MemoryMessageStore store("broker-a", "10.0.0.1:10911", 4);
  auto               future = store.AsyncPutMessage(MakeMessage(3, "async"));
  assert(future.get().IsOk());
  assert(store.MaxOffset("orders", 3) == 1);
}

void TestZeroQueuesIsRejected() {
  bool threw = false;
  try {
    MemoryMessageStore store("broker-a", "10.0.0.1:10911", 0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestAppendAssignsOffsetsAndIdentity();
  TestIllegalMessagesAreRejected();
  TestStoredMessageCarriesBrokerFields();
  TestOffsetStatuses();
  TestBatchReadAndRelease();
  TestTagFilterSkipsUnmatched();
  TestAsyncPutIsReady();
  TestZeroQueuesIsRejected();

  std::cout << "broker_failover_unit_memory_message_store: pass\n";
  return 0;
}
