#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "internal/model/put_status.hpp"

namespace failover::model {

// Where a local store appended a message.
struct AppendResult {
  std::int64_t commit_log_offset = 0;
  std::int64_t queue_offset = 0;
  std::int32_t wrote_bytes = 0;
  std::int64_t store_timestamp_ms = 0;
  std::string msg_id;
};

/*
  Outcome of a put, local or escaped.

  remote() is set for results produced by forwarding the message to
  another broker; those never carry append info.
*/
class PutResult {
 public:
  PutResult(PutStatus status, std::optional<AppendResult> append_result, bool remote = false)
      : status_(status), append_result_(std::move(append_result)), remote_(remote) {
  }

  PutStatus status() const {
    return status_;
  }

  const std::optional<AppendResult>& append_result() const {
    return append_result_;
  }

  bool remote() const {
    return remote_;
  }

  bool IsOk() const {
    return status_ == PutStatus::kOk;
  }

 private:
  PutStatus status_;
  std::optional<AppendResult> append_result_;
  bool remote_;
};

}  // namespace failover::model
