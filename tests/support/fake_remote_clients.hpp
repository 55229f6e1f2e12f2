#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "client/cpp/remote_client_factory.h"

namespace failover::testing {

/*
  Scripted remote clients for bridge tests.

  The bridge owns the client objects, so behavior and observations live in
  shared scripts the test keeps hold of.
*/

enum class AsyncMode {
  kSucceed,        // invoke on_success inline
  kFailCallback,   // invoke on_exception inline
  kReject,         // return a non-OK status, never call back
  kThrow,          // throw from SendAsync
  kThrowNonStd,    // throw a value outside the std::exception hierarchy
  kHold,           // keep the callback for the test to fire later
};

struct ProducerScript {
  arrow::Status start_status = arrow::Status::OK();
  arrow::Result<failover::broker::v1::SendResult> send_result = arrow::Status::IOError("no send result scripted");
  bool throw_on_send = false;
  bool throw_non_std = false;
  AsyncMode async_mode = AsyncMode::kSucceed;

  // Queues handed to selector-based sends.
  std::vector<failover::broker::v1::MessageQueue> publish_queues;

  int start_calls = 0;
  int shutdown_calls = 0;
  std::string namesrv_addr;
  std::string group;
  std::vector<failover::broker::v1::Message> sent;
  std::string last_selector_arg;
  failover::broker::v1::MessageQueue last_selected_queue;
  failover::client::SendCallback held_callback;
};

struct ConsumerScript {
  arrow::Status start_status = arrow::Status::OK();
  arrow::Result<failover::broker::v1::PullResult> pull_result = arrow::Status::IOError("no pull result scripted");
  bool throw_on_pull = false;
  bool throw_non_std = false;

  int start_calls = 0;
  int shutdown_calls = 0;
  std::string group;
  std::vector<failover::broker::v1::MessageQueue> pulled_queues;
  std::string last_sub_expression;
  int64_t last_offset = -1;
  int32_t last_max_nums = -1;
};

// Remote clients may sit on code that throws arbitrary values.
[[noreturn]] inline void ThrowScripted(bool non_std, const char* what) {
  if (non_std) {
    throw 42;
  }
  throw std::runtime_error(what);
}

class FakeRemoteProducer final : public failover::client::RemoteProducer {
 public:
  FakeRemoteProducer(std::string group, std::shared_ptr<ProducerScript> script) : group_(std::move(group)), script_(std::move(script)) {
    script_->group = group_;
  }

  arrow::Status Start(const std::string& namesrv_addr) override {
    ++script_->start_calls;
    script_->namesrv_addr = namesrv_addr;
    return script_->start_status;
  }

  void Shutdown() override {
    ++script_->shutdown_calls;
  }

  arrow::Result<failover::broker::v1::SendResult> Send(const failover::broker::v1::Message& message) override {
    script_->sent.push_back(message);
    if (script_->throw_on_send) {
      ThrowScripted(script_->throw_non_std, "connection reset");
    }
    return script_->send_result;
  }

  arrow::Status SendAsync(const failover::broker::v1::Message& message, failover::client::SendCallback callback) override {
    script_->sent.push_back(message);
    switch (script_->async_mode) {
      case AsyncMode::kSucceed:
        if (script_->send_result.ok()) {
          callback.on_success(*script_->send_result);
        } else {
          callback.on_exception(script_->send_result.status());
        }
        return arrow::Status::OK();
      case AsyncMode::kFailCallback:
        callback.on_exception(arrow::Status::IOError("broker unreachable"));
        return arrow::Status::OK();
      case AsyncMode::kReject:
        return arrow::Status::Invalid("producer not started");
      case AsyncMode::kThrow:
        throw std::runtime_error("send queue full");
      case AsyncMode::kThrowNonStd:
        throw 42;
      case AsyncMode::kHold:
        script_->held_callback = std::move(callback);
        return arrow::Status::OK();
    }
    return arrow::Status::OK();
  }

  arrow::Result<failover::broker::v1::SendResult> Send(const failover::broker::v1::Message& message,
                                                       const failover::client::MessageQueueSelector& selector, const std::string& arg) override {
    script_->sent.push_back(message);
    script_->last_selector_arg = arg;
    if (script_->throw_on_send) {
      ThrowScripted(script_->throw_non_std, "connection reset");
    }
    if (!script_->publish_queues.empty()) {
      script_->last_selected_queue = selector(script_->publish_queues, message, arg);
    }
    return script_->send_result;
  }

  const std::string& group() const override {
    return group_;
  }

 private:
  std::string group_;
  std::shared_ptr<ProducerScript> script_;
};

class FakeRemotePullConsumer final : public failover::client::RemotePullConsumer {
 public:
  FakeRemotePullConsumer(std::string group, std::shared_ptr<ConsumerScript> script)
      : group_(std::move(group)), script_(std::move(script)) {
    script_->group = group_;
  }

  arrow::Status Start(const std::string&) override {
    ++script_->start_calls;
    return script_->start_status;
  }

  void Shutdown() override {
    ++script_->shutdown_calls;
  }

  arrow::Result<failover::broker::v1::PullResult> Pull(const failover::broker::v1::MessageQueue& queue, const std::string& sub_expression,
                                                       int64_t offset, int32_t max_nums) override {
    script_->pulled_queues.push_back(queue);
    script_->last_sub_expression = sub_expression;
    script_->last_offset = offset;
    script_->last_max_nums = max_nums;
    if (script_->throw_on_pull) {
      ThrowScripted(script_->throw_non_std, "pull timed out");
    }
    return script_->pull_result;
  }

  const std::string& group() const override {
    return group_;
  }

 private:
  std::string group_;
  std::shared_ptr<ConsumerScript> script_;
};

class FakeRemoteClientFactory final : public failover::client::RemoteClientFactory {
 public:
  std::shared_ptr<ProducerScript> producer = std::make_shared<ProducerScript>();
  std::shared_ptr<ConsumerScript> consumer = std::make_shared<ConsumerScript>();

  std::unique_ptr<failover::client::RemoteProducer> CreateProducer(const std::string& group) override {
    return std::make_unique<FakeRemoteProducer>(group, producer);
  }

  std::unique_ptr<failover::client::RemotePullConsumer> CreatePullConsumer(const std::string& group) override {
    return std::make_unique<FakeRemotePullConsumer>(group, consumer);
  }
};

inline failover::broker::v1::SendResult MakeSendResult(failover::broker::v1::SendStatus status) {
  failover::broker::v1::SendResult result;
  result.set_send_status(status);
  result.set_msg_id("remote-msg-1");
  result.mutable_message_queue()->set_broker_name("broker-b");
  return result;
}

} // namespace failover::testing
