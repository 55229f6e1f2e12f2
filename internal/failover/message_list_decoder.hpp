#pragma once

#include <arrow/buffer.h>

#include <functional>
#include <optional>
#include <vector>

#include "failover/broker/v1/message.pb.h"
#include "internal/store/read_batch.hpp"

namespace failover::bridge {

using MessageDecoder = std::function<std::optional<failover::broker::v1::Message>(const arrow::Buffer&)>;

/*
  Decodes every buffer of a local read, in order.

  Each decoded message gets the store-assigned offset recorded for its
  buffer in place of whatever offset the frame carries. Null buffers and
  frames the decoder rejects are logged and skipped.

  The batch is released exactly once before returning, including when the
  decoder throws; the exception then propagates.
*/
std::vector<failover::broker::v1::Message> DecodeMessageList(failover::store::ReadBatch& batch);
std::vector<failover::broker::v1::Message> DecodeMessageList(failover::store::ReadBatch& batch, const MessageDecoder& decoder);

} // namespace failover::bridge
