#include "pwss/frame.hpp"

namespace pwss {
namespace ws {

size_t encode_frame_header(uint8_t* buf, OpCode opcode, uint64_t payload_len) {
  size_t pos = 0;
  buf[pos++] = 0x80 | static_cast<uint8_t>(opcode);
  if (payload_len < kLength16) {
    buf[pos++] = static_cast<uint8_t>(payload_len);
  } else if (payload_len <= 0xFFFF) {
    buf[pos++] = kLength16;
    buf[pos++] = static_cast<uint8_t>((payload_len >> 8) & 0xFF);
    buf[pos++] = static_cast<uint8_t>(payload_len & 0xFF);
  } else {
    buf[pos++] = kLength64;
    for (int i = 7; i >= 0; --i) {
      buf[pos++] = static_cast<uint8_t>((payload_len >> (i * 8)) & 0xFF);
    }
  }
  return pos;
}

void unmask_payload(uint8_t* payload, size_t len, const uint8_t* mask_key) {
  for (size_t i = 0; i < len; ++i) {
    payload[i] ^= mask_key[i % 4];
  }
}

expected<IncomingFrame, ErrorCode> read_frame(ByteSource& source, uint64_t max_payload) {
  using Result = expected<IncomingFrame, ErrorCode>;

  // ReadHeader
  uint8_t head[2];
  auto r = source.read_exact(head, sizeof(head));
  if (!r) {
    return Result::error(r.get_error());
  }

  FrameHeader header;
  header.fin = (head[0] & 0x80) != 0;
  header.opcode = static_cast<OpCode>(head[0] & 0x0F);
  header.masked = (head[1] & 0x80) != 0;
  if (!header.masked) {
    return Result::error(ErrorCode::kUnmaskedFrame);
  }

  // ReadExtendedLength
  uint64_t len = head[1] & 0x7F;
  if (len == kLength16) {
    uint8_t ext[2];
    r = source.read_exact(ext, sizeof(ext));
    if (!r) {
      return Result::error(r.get_error());
    }
    len = (static_cast<uint64_t>(ext[0]) << 8) | ext[1];
  } else if (len == kLength64) {
    uint8_t ext[8];
    r = source.read_exact(ext, sizeof(ext));
    if (!r) {
      return Result::error(r.get_error());
    }
    len = 0;
    for (int i = 0; i < 8; ++i) {
      len = (len << 8) | ext[i];
    }
  }
  header.payload_len = len;

  // ReadMaskKey
  r = source.read_exact(header.mask_key.data(), header.mask_key.size());
  if (!r) {
    return Result::error(r.get_error());
  }

  if (header.payload_len > max_payload) {
    return Result::error(ErrorCode::kPayloadTooLarge);
  }

  // ReadPayload
  IncomingFrame frame;
  frame.fin = header.fin;
  frame.payload.resize(static_cast<size_t>(header.payload_len));
  if (!frame.payload.empty()) {
    r = source.read_exact(frame.payload.data(), frame.payload.size());
    if (!r) {
      return Result::error(r.get_error());
    }
    unmask_payload(frame.payload.data(), frame.payload.size(), header.mask_key.data());
  }

  // Classify
  switch (header.opcode) {
    case OpCode::kContinuation:
    case OpCode::kBinary:
      frame.kind = FrameKind::kData;
      break;
    case OpCode::kPing:
      frame.kind = FrameKind::kPing;
      break;
    case OpCode::kPong:
      frame.kind = FrameKind::kPong;
      break;
    case OpCode::kClose:
      frame.kind = FrameKind::kClose;
      break;
    default:
      return Result::error(ErrorCode::kUnsupportedOpcode);
  }
  return Result::success(std::move(frame));
}

}  // namespace ws
}  // namespace pwss
