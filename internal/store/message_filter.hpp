#pragma once

#include <memory>
#include <string>
#include <unordered_set>

#include "failover/broker/v1/message.pb.h"

namespace failover::store {

class MessageFilter {
 public:
  virtual ~MessageFilter() = default;

  virtual bool IsMatched(const failover::broker::v1::Message& message) const = 0;
};

/*
  Tag subscription filter.

  "*" or an empty expression subscribes to everything, otherwise the
  expression is a "||"-separated list of tags.
*/
class TagFilter final : public MessageFilter {
 public:
  explicit TagFilter(const std::string& expression);

  bool IsMatched(const failover::broker::v1::Message& message) const override;

  bool subscribes_all() const {
    return subscribe_all_;
  }

 private:
  bool                            subscribe_all_ = false;
  std::unordered_set<std::string> tags_;
};

// Returns nullptr for expressions that match every message.
std::shared_ptr<MessageFilter> MakeTagFilter(const std::string& expression);

} // namespace failover::store
