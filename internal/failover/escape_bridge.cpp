#include "escape_bridge.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "client/cpp/route_client.h"
#include "internal/failover/message_list_decoder.hpp"
#include "internal/failover/put_completion.hpp"
#include "internal/failover/put_result_translator.hpp"
#include "internal/failover/queue_selector.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace failover::bridge {

using failover::broker::v1::Message;
using failover::model::PutResult;
using failover::model::PutStatus;
using failover::observability::BoolField;
using failover::observability::IntField;
using failover::observability::StringField;

namespace {

constexpr const char* kSubscribeAll = "*";

std::string GroupName(const char* prefix, const failover::runtime::config::BrokerConfig& config) {
  return std::string(prefix) + "_" + config.broker_name() + "_" + std::to_string(config.broker_id());
}

} // namespace

EscapeBridge::EscapeBridge(failover::runtime::config::BrokerConfig config, std::shared_ptr<failover::store::StoreLocator> stores,
                           std::shared_ptr<failover::client::RemoteClientFactory> clients)
    : config_(std::move(config)),
      stores_(std::move(stores)),
      clients_(std::move(clients)),
      inner_producer_group_(GroupName("InnerProducerGroup", config_)),
      inner_consumer_group_(GroupName("InnerConsumerGroup", config_)) {
  if (!stores_) {
    throw std::invalid_argument("escape bridge needs a store locator");
  }
}

EscapeBridge::~EscapeBridge() {
  Shutdown();
}

bool EscapeBridge::EscapeEnabled() const {
  return config_.enable_slave_acting_master() && config_.enable_remote_escape();
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

void EscapeBridge::Start() {
  if (state_ != State::kUninitialized) {
    throw failover::util::InvalidState("escape bridge already started");
  }

  if (EscapeEnabled()) {
    const auto& namesrv_addr = config_.namesrv_addr();
    if (failover::client::SplitNameServerList(namesrv_addr).empty()) {
      throw failover::util::ConfigurationError("name server address list is empty while remote escape is enabled");
    }
    if (!clients_) {
      throw failover::util::ConfigurationError("remote escape is enabled but no remote client factory is configured");
    }

    StartInnerProducer(namesrv_addr);
    StartInnerConsumer(namesrv_addr);
    FAILOVER_LOG_INFO("start inner producer and consumer success",
                      {StringField("producer_group", inner_producer_group_), StringField("consumer_group", inner_consumer_group_)});
  }

  state_ = State::kStarted;
}

void EscapeBridge::Shutdown() {
  if (inner_producer_) {
    inner_producer_->Shutdown();
    inner_producer_.reset();
  }

  if (inner_consumer_) {
    inner_consumer_->Shutdown();
    inner_consumer_.reset();
  }

  if (state_ == State::kStarted) {
    state_ = State::kStopped;
  }
}

void EscapeBridge::StartInnerProducer(const std::string& namesrv_addr) {
  auto producer = clients_->CreateProducer(inner_producer_group_);
  const auto status = producer->Start(namesrv_addr);
  if (!status.ok()) {
    FAILOVER_LOG_ERROR("start inner producer failed", {StringField("namesrv_addr", namesrv_addr), StringField("error", status.ToString())});
    throw std::runtime_error("start inner producer failed: " + status.ToString());
  }
  inner_producer_ = std::move(producer);
}

void EscapeBridge::StartInnerConsumer(const std::string& namesrv_addr) {
  auto consumer = clients_->CreatePullConsumer(inner_consumer_group_);
  const auto status = consumer->Start(namesrv_addr);
  if (!status.ok()) {
    FAILOVER_LOG_ERROR("start inner consumer failed", {StringField("namesrv_addr", namesrv_addr), StringField("error", status.ToString())});
    throw std::runtime_error("start inner consumer failed: " + status.ToString());
  }
  inner_consumer_ = std::move(consumer);
}

// ------------------------------------------------------------
// Write path
// ------------------------------------------------------------

EscapeDecision EscapeBridge::Decide() const {
  EscapeDecision decision;
  if (auto master = stores_->PeekMasterStore()) {
    decision.action = EscapeAction::kLocalStore;
    decision.master = std::move(master);
  } else if (EscapeEnabled() && inner_producer_) {
    decision.action = EscapeAction::kRemoteSend;
  } else {
    decision.action = EscapeAction::kUnavailable;
  }
  return decision;
}

PutResult EscapeBridge::ServiceNotAvailable(const char* operation) const {
  FAILOVER_LOG_WARN(operation, {BoolField("enable_slave_acting_master", config_.enable_slave_acting_master()),
                                BoolField("enable_remote_escape", config_.enable_remote_escape())});
  return PutResult(PutStatus::kServiceNotAvailable, std::nullopt);
}

PutResult EscapeBridge::PutMessage(Message& message) {
  auto decision = Decide();
  switch (decision.action) {
    case EscapeAction::kLocalStore:
      return decision.master->PutMessage(message);

    case EscapeAction::kRemoteSend:
      // The remote hop re-stamps born time and message id, so local
      // durability acks cannot be honored.
      message.set_wait_store_msg_ok(false);
      try {
        auto send_result = inner_producer_->Send(message);
        if (!send_result.ok()) {
          FAILOVER_LOG_ERROR("send message in failover to remote failed",
                             {StringField("topic", message.topic()), StringField("error", send_result.status().ToString())});
          return RemoteSendFailed();
        }
        return TranslateSendResult(*send_result);
      } catch (const std::exception& e) {
        FAILOVER_LOG_ERROR("send message in failover to remote failed", {StringField("topic", message.topic()), StringField("error", e.what())});
        return RemoteSendFailed();
      } catch (...) {
        FAILOVER_LOG_ERROR("send message in failover to remote failed", {StringField("topic", message.topic()), StringField("error", "unknown exception")});
        return RemoteSendFailed();
      }

    case EscapeAction::kUnavailable:
    default:
      return ServiceNotAvailable("put message failed");
  }
}

std::future<PutResult> EscapeBridge::AsyncPutMessage(Message& message) {
  auto decision = Decide();
  switch (decision.action) {
    case EscapeAction::kLocalStore:
      return decision.master->AsyncPutMessage(message);

    case EscapeAction::kRemoteSend: {
      auto completion = std::make_shared<PutCompletion>();
      auto future     = completion->TakeFuture();

      message.set_wait_store_msg_ok(false);
      try {
        failover::client::SendCallback callback;
        callback.on_success = [completion](const failover::broker::v1::SendResult& send_result) {
          completion->Complete(TranslateSendResult(send_result));
        };
        callback.on_exception = [completion, topic = message.topic()](const arrow::Status& status) {
          FAILOVER_LOG_ERROR("async send message in failover to remote failed", {StringField("topic", topic), StringField("error", status.ToString())});
          completion->Complete(RemoteSendFailed());
        };

        const auto status = inner_producer_->SendAsync(message, std::move(callback));
        if (!status.ok()) {
          FAILOVER_LOG_ERROR("send message in failover to remote failed",
                             {StringField("topic", message.topic()), StringField("error", status.ToString())});
          completion->Complete(RemoteSendFailed());
        }
      } catch (const std::exception& e) {
        FAILOVER_LOG_ERROR("send message in failover to remote failed", {StringField("topic", message.topic()), StringField("error", e.what())});
        completion->Complete(RemoteSendFailed());
      } catch (...) {
        FAILOVER_LOG_ERROR("send message in failover to remote failed", {StringField("topic", message.topic()), StringField("error", "unknown exception")});
        completion->Complete(RemoteSendFailed());
      }
      return future;
    }

    case EscapeAction::kUnavailable:
    default:
      return ReadyFuture(ServiceNotAvailable("put message failed"));
  }
}

PutResult EscapeBridge::PutMessageToSpecificQueue(Message& message) {
  auto decision = Decide();
  switch (decision.action) {
    case EscapeAction::kLocalStore:
      return decision.master->PutMessage(message);

    case EscapeAction::kRemoteSend:
      message.set_wait_store_msg_ok(false);
      try {
        auto send_result = inner_producer_->Send(message, HashQueueSelector(), RoutingKey(message));
        if (!send_result.ok()) {
          FAILOVER_LOG_ERROR("send message to specific queue in failover to remote failed",
                             {StringField("topic", message.topic()), StringField("error", send_result.status().ToString())});
          return RemoteSendFailed();
        }
        return TranslateSendResult(*send_result);
      } catch (const std::exception& e) {
        FAILOVER_LOG_ERROR("send message to specific queue in failover to remote failed",
                           {StringField("topic", message.topic()), StringField("error", e.what())});
        return RemoteSendFailed();
      } catch (...) {
        FAILOVER_LOG_ERROR("send message to specific queue in failover to remote failed",
                           {StringField("topic", message.topic()), StringField("error", "unknown exception")});
        return RemoteSendFailed();
      }

    case EscapeAction::kUnavailable:
    default:
      return ServiceNotAvailable("put message to specific queue failed");
  }
}

// ------------------------------------------------------------
// Read path
// ------------------------------------------------------------

std::optional<Message> EscapeBridge::GetMessage(const std::string& topic, int64_t offset, int32_t queue_id, const std::string& broker_name) {
  if (auto store = stores_->GetStoreByBrokerName(broker_name)) {
    auto batch = store->GetMessage(inner_consumer_group_, topic, queue_id, offset, 1, nullptr);
    if (!batch) {
      FAILOVER_LOG_WARN("get message result is null", {StringField("consumer_group", inner_consumer_group_), StringField("topic", topic),
                                                       IntField("offset", offset), IntField("queue_id", queue_id)});
      return std::nullopt;
    }

    const auto status = batch->status();
    auto       found  = DecodeMessageList(*batch);
    if (found.empty()) {
      FAILOVER_LOG_WARN("can not get message", {StringField("topic", topic), IntField("offset", offset), IntField("queue_id", queue_id),
                                                StringField("status", failover::store::ToString(status))});
      return std::nullopt;
    }
    return std::move(found.front());
  }

  if (inner_consumer_) {
    return GetMessageFromRemote(topic, offset, queue_id, broker_name);
  }

  return std::nullopt;
}

std::optional<Message> EscapeBridge::GetMessageFromRemote(const std::string& topic, int64_t offset, int32_t queue_id,
                                                          const std::string& broker_name) {
  failover::broker::v1::MessageQueue queue;
  queue.set_topic(topic);
  queue.set_broker_name(broker_name);
  queue.set_queue_id(queue_id);

  try {
    auto pull_result = inner_consumer_->Pull(queue, kSubscribeAll, offset, 1);
    if (!pull_result.ok()) {
      FAILOVER_LOG_ERROR("get message from remote failed",
                         {StringField("topic", topic), StringField("broker_name", broker_name), StringField("error", pull_result.status().ToString())});
      return std::nullopt;
    }
    if (pull_result->pull_status() == failover::broker::v1::PULL_STATUS_FOUND && pull_result->msg_found_list_size() > 0) {
      return pull_result->msg_found_list(0);
    }
  } catch (const std::exception& e) {
    FAILOVER_LOG_ERROR("get message from remote failed",
                       {StringField("topic", topic), StringField("broker_name", broker_name), StringField("error", e.what())});
  } catch (...) {
    FAILOVER_LOG_ERROR("get message from remote failed",
                       {StringField("topic", topic), StringField("broker_name", broker_name), StringField("error", "unknown exception")});
  }

  return std::nullopt;
}

} // namespace failover::bridge
