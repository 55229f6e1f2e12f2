#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "client/cpp/remote_client_factory.h"
#include "config/config.pb.h"
#include "failover/broker/v1/message.pb.h"
#include "internal/model/put_result.hpp"
#include "internal/store/store_locator.hpp"

namespace failover::bridge {

enum class EscapeAction {
  kLocalStore,
  kRemoteSend,
  kUnavailable,
};

// Where a write goes; master is set only for kLocalStore.
struct EscapeDecision {
  EscapeAction                     action = EscapeAction::kUnavailable;
  failover::store::MessageStorePtr master;
};

/*
  EscapeBridge

  Serves writes and reads of a node that may have no master store role.
  Writes go to the local master store when one is designated, otherwise
  they escape to a remote broker through an inner producer; reads go to
  the local store of the requested broker, otherwise to a remote broker
  through an inner pull consumer.

  Remote failures always come back as values: a kRemoteSendFailed result
  or an empty optional. Only Start() throws.

  The bridge holds no locks. The two inner clients are written by
  Start/Shutdown only; the broker lifecycle must not run those
  concurrently with traffic.
*/
class EscapeBridge {
 public:
  enum class State {
    kUninitialized,
    kStarted,
    kStopped,
  };

  EscapeBridge(failover::runtime::config::BrokerConfig config, std::shared_ptr<failover::store::StoreLocator> stores,
               std::shared_ptr<failover::client::RemoteClientFactory> clients);
  ~EscapeBridge();

  EscapeBridge(const EscapeBridge&)            = delete;
  EscapeBridge& operator=(const EscapeBridge&) = delete;

  /*
    Brings up the inner producer and pull consumer when both slave acting
    master and remote escape are enabled; otherwise only records the state
    change.

    Throws ConfigurationError when escape is enabled with no name server
    address, InvalidState when called twice, and std::runtime_error when a
    client fails to start.
  */
  void Start();

  // Idempotent; stops whichever clients were started.
  void Shutdown();

  failover::model::PutResult PutMessage(failover::broker::v1::Message& message);

  // The returned future always completes with a value once a send is tried.
  std::future<failover::model::PutResult> AsyncPutMessage(failover::broker::v1::Message& message);

  // Like PutMessage, but the remote queue is chosen by hashing topic + store host.
  failover::model::PutResult PutMessageToSpecificQueue(failover::broker::v1::Message& message);

  std::optional<failover::broker::v1::Message> GetMessage(const std::string& topic, int64_t offset, int32_t queue_id,
                                                          const std::string& broker_name);

  // Evaluated fresh on every call.
  EscapeDecision Decide() const;

  State state() const {
    return state_;
  }

  const std::string& inner_producer_group() const {
    return inner_producer_group_;
  }
  const std::string& inner_consumer_group() const {
    return inner_consumer_group_;
  }

 private:
  bool EscapeEnabled() const;

  void StartInnerProducer(const std::string& namesrv_addr);
  void StartInnerConsumer(const std::string& namesrv_addr);

  failover::model::PutResult ServiceNotAvailable(const char* operation) const;

  std::optional<failover::broker::v1::Message> GetMessageFromRemote(const std::string& topic, int64_t offset, int32_t queue_id,
                                                                    const std::string& broker_name);

  failover::runtime::config::BrokerConfig                config_;
  std::shared_ptr<failover::store::StoreLocator>         stores_;
  std::shared_ptr<failover::client::RemoteClientFactory> clients_;

  const std::string inner_producer_group_;
  const std::string inner_consumer_group_;

  std::unique_ptr<failover::client::RemoteProducer>     inner_producer_;
  std::unique_ptr<failover::client::RemotePullConsumer> inner_consumer_;

  State state_ = State::kUninitialized;
};

} // namespace failover::bridge
