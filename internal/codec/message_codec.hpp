#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <optional>

#include "failover/broker/v1/message.pb.h"

namespace failover::codec {

/*
  Stored message frame:

    [u32 total length, little endian][u32 magic][serialized Message]

  total length counts the whole frame including the two header words.
*/

constexpr uint32_t kMessageMagicCode = 0xAABBCCDD;
constexpr size_t   kFrameHeaderBytes = 8;

std::shared_ptr<arrow::Buffer> EncodeMessage(const failover::broker::v1::Message& message);

// Returns nullopt for truncated frames, bad magic or an unparsable body.
std::optional<failover::broker::v1::Message> DecodeMessage(const arrow::Buffer& buffer);

} // namespace failover::codec
