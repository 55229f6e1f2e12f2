#pragma once

#include <atomic>
#include <future>
#include <memory>

#include "internal/model/put_result.hpp"

namespace failover::bridge {

/*
  Completion handle bridging a send callback to a caller-visible future.

  Shared between the initiating call and the callback; the first Complete
  wins and later ones are ignored, so every path may complete without
  coordinating with the others.
*/
class PutCompletion {
 public:
  PutCompletion() : future_(promise_.get_future()) {
  }

  std::future<failover::model::PutResult> TakeFuture() {
    return std::move(future_);
  }

  bool Complete(failover::model::PutResult result) {
    if (completed_.exchange(true)) {
      return false;
    }
    promise_.set_value(std::move(result));
    return true;
  }

  bool completed() const {
    return completed_.load();
  }

 private:
  std::promise<failover::model::PutResult> promise_;
  std::future<failover::model::PutResult>  future_;
  std::atomic<bool>                        completed_{false};
};

inline std::future<failover::model::PutResult> ReadyFuture(failover::model::PutResult result) {
  std::promise<failover::model::PutResult> promise;
  promise.set_value(std::move(result));
  return promise.get_future();
}

} // namespace failover::bridge
