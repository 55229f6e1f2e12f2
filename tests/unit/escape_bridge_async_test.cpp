#include "internal/failover/escape_bridge.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/failover/put_completion.hpp"
#include "internal/store/memory/memory_message_store.hpp"
#include "internal/store/store_registry.hpp"
#include "support/fake_remote_clients.hpp"

namespace {

using failover::bridge::EscapeBridge;
using failover::bridge::PutCompletion;
using failover::broker::v1::Message;
using failover::model::PutResult;
using failover::model::PutStatus;
using failover::testing::AsyncMode;
using failover::testing::FakeRemoteClientFactory;
using failover::testing::MakeSendResult;

failover::runtime::config::BrokerConfig SlaveConfig(bool remote_escape = true) {
  failover::runtime::config::BrokerConfig config;
  config.set_broker_name("broker-a");
  config.set_broker_id(1);
  config.set_enable_slave_acting_master(true);
  config.set_enable_remote_escape(remote_escape);
  config.set_namesrv_addr("127.0.0.1:9876");
  return config;
}

Message MakeMessage() {
  Message message;
  message.set_topic("orders");
  message.set_body("payload");
  message.set_wait_store_msg_ok(true);
  return message;
}

struct Fixture {
  std::shared_ptr<failover::store::StoreRegistry> stores  = std::make_shared<failover::store::StoreRegistry>();
  std::shared_ptr<FakeRemoteClientFactory>        clients = std::make_shared<FakeRemoteClientFactory>();
  std::unique_ptr<EscapeBridge>                   bridge;

  explicit Fixture(bool remote_escape = true) {
    stores->RegisterStore(std::make_shared<failover::store::MemoryMessageStore>("broker-a", "10.0.0.1:10911", 4));
    bridge = std::make_unique<EscapeBridge>(SlaveConfig(remote_escape), stores, clients);
    bridge->Start();
  }
};

bool IsReady(std::future<PutResult>& future) {
  return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void TestAsyncLocalMasterCompletesWithAppend() {
  Fixture fx;
  fx.stores->SetMaster("broker-a");

  auto message = MakeMessage();
  auto future  = fx.bridge->AsyncPutMessage(message);
  const auto result = future.get();
  assert(result.status() == PutStatus::kOk);
  assert(!result.remote());
  assert(result.append_result().has_value());
  assert(fx.clients->producer->sent.empty());
}

void TestAsyncRemoteSuccessIsTranslated() {
  Fixture fx;
  fx.clients->producer->send_result = MakeSendResult(failover::broker::v1::SEND_STATUS_FLUSH_SLAVE_TIMEOUT);

  auto message = MakeMessage();
  auto future  = fx.bridge->AsyncPutMessage(message);
  const auto result = future.get();
  assert(result.status() == PutStatus::kFlushReplicaTimeout);
  assert(result.remote());
  assert(!fx.clients->producer->sent[0].wait_store_msg_ok());
}

void TestAsyncCallbackFailureIsRemoteSendFailed() {
  Fixture fx;
  fx.clients->producer->async_mode = AsyncMode::kFailCallback;

  auto message = MakeMessage();
  const auto result = fx.bridge->AsyncPutMessage(message).get();
  assert(result.status() == PutStatus::kRemoteSendFailed);
  assert(result.remote());
}

void TestAsyncRejectedSendCompletesImmediately() {
  Fixture fx;
  fx.clients->producer->async_mode = AsyncMode::kReject;

  auto message = MakeMessage();
  auto future  = fx.bridge->AsyncPutMessage(message);
  assert(IsReady(future));
  assert(future.get().status() == PutStatus::kRemoteSendFailed);
}

void TestAsyncThrowingSendCompletesImmediately() {
  Fixture fx;
  fx.clients->producer->async_mode = AsyncMode::kThrow;

  auto message = MakeMessage();
  auto future  = fx.bridge->AsyncPutMessage(message);
  assert(IsReady(future));
  const auto result = future.get();
  assert(result.status() == PutStatus::kRemoteSendFailed);
  assert(result.remote());
}

void TestAsyncNonStdThrowStillCompletes() {
  Fixture fx;
  fx.clients->producer->async_mode = AsyncMode::kThrowNonStd;

  auto message = MakeMessage();
  auto future  = fx.bridge->AsyncPutMessage(message);
  assert(IsReady(future));
  const auto result = future.get();
  assert(result.status() == PutStatus::kRemoteSendFailed);
  assert(result.remote());
}

void TestAsyncCompletesFromCallbackThread() {
  Fixture fx;
  fx.clients->producer->async_mode = AsyncMode::kHold;

  auto message = MakeMessage();
  auto future  = fx.bridge->AsyncPutMessage(message);
  assert(!IsReady(future));

  auto callback = fx.clients->producer->held_callback;
  std::thread io_thread([callback]() { callback.on_success(MakeSendResult(failover::broker::v1::SEND_STATUS_SEND_OK)); });
  const auto result = future.get();
  io_thread.join();

  assert(result.status() == PutStatus::kOk);
  assert(result.remote());
}

void TestAsyncUnavailableIsReady() {
  Fixture fx(/*remote_escape=*/false);

  auto message = MakeMessage();
  auto future  = fx.bridge->AsyncPutMessage(message);
  assert(IsReady(future));
  const auto result = future.get();
  assert(result.status() == PutStatus::kServiceNotAvailable);
  assert(!result.remote());
}

void TestCompletionFirstResultWins() {
  auto completion = std::make_shared<PutCompletion>();
  auto future     = completion->TakeFuture();

  assert(completion->Complete(PutResult(PutStatus::kOk, std::nullopt, true)));
  assert(!completion->Complete(PutResult(PutStatus::kRemoteSendFailed, std::nullopt, true)));
  assert(completion->completed());
  assert(future.get().status() == PutStatus::kOk);
}

void TestCompletionRacingCompletersSetOnce() {
  auto completion = std::make_shared<PutCompletion>();
  auto future     = completion->TakeFuture();

  std::atomic<int>         wins{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([completion, &wins, i]() {
      const auto status = i % 2 == 0 ? PutStatus::kOk : PutStatus::kRemoteSendFailed;
      if (completion->Complete(PutResult(status, std::nullopt, true))) {
        wins.fetch_add(1);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  assert(wins.load() == 1);
  assert(IsReady(future));
}

} // namespace

int main() {
  TestAsyncLocalMasterCompletesWithAppend();
  TestAsyncRemoteSuccessIsTranslated();
  TestAsyncCallbackFailureIsRemoteSendFailed();
  TestAsyncRejectedSendCompletesImmediately();
  TestAsyncThrowingSendCompletesImmediately();
  TestAsyncNonStdThrowStillCompletes();
  TestAsyncCompletesFromCallbackThread();
  TestAsyncUnavailableIsReady();
  TestCompletionFirstResultWins();
  TestCompletionRacingCompletersSetOnce();

  std::cout << "broker_failover_unit_escape_bridge_async: pass\n";
  return 0;
}
