#include "message_codec.hpp"

#include <arrow/memory_pool.h>

#include <limits>
#include <stdexcept>
#include <string>

namespace failover::codec {

namespace {

void PutUint32(uint8_t* out, uint32_t value) {
  out[0] = static_cast<uint8_t>(value);
  out[1] = static_cast<uint8_t>(value >> 8);
  out[2] = static_cast<uint8_t>(value >> 16);
  out[3] = static_cast<uint8_t>(value >> 24);
}

uint32_t GetUint32(const uint8_t* in) {
  return static_cast<uint32_t>(in[0]) | (static_cast<uint32_t>(in[1]) << 8) | (static_cast<uint32_t>(in[2]) << 16) |
         (static_cast<uint32_t>(in[3]) << 24);
}

} // namespace

std::shared_ptr<arrow::Buffer> EncodeMessage(const failover::broker::v1::Message& message) {
  const size_t body_size  = message.ByteSizeLong();
  const size_t total_size = kFrameHeaderBytes + body_size;
  if (total_size > std::numeric_limits<uint32_t>::max()) {
    throw std::runtime_error("message too large to encode: " + std::to_string(total_size) + " bytes");
  }

  auto maybe_buffer = arrow::AllocateBuffer(static_cast<int64_t>(total_size));
  if (!maybe_buffer.ok()) {
    throw std::runtime_error("message buffer allocate failed: " + maybe_buffer.status().ToString());
  }

  std::shared_ptr<arrow::Buffer> buffer(std::move(*maybe_buffer));
  uint8_t*                       data = buffer->mutable_data();
  PutUint32(data, static_cast<uint32_t>(total_size));
  PutUint32(data + 4, kMessageMagicCode);
  if (!message.SerializeToArray(data + kFrameHeaderBytes, static_cast<int>(body_size))) {
    throw std::runtime_error("message serialize failed");
  }
  return buffer;
}

std::optional<failover::broker::v1::Message> DecodeMessage(const arrow::Buffer& buffer) {
  const auto size = static_cast<size_t>(buffer.size());
  if (size < kFrameHeaderBytes) {
    return std::nullopt;
  }

  const uint8_t* data = buffer.data();
  if (GetUint32(data) != size || GetUint32(data + 4) != kMessageMagicCode) {
    return std::nullopt;
  }

  failover::broker::v1::Message message;
  if (!message.ParseFromArray(data + kFrameHeaderBytes, static_cast<int>(size - kFrameHeaderBytes))) {
    return std::nullopt;
  }
  return message;
}

} // namespace failover::codec
