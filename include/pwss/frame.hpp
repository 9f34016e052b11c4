#ifndef PWSS_FRAME_HPP_
#define PWSS_FRAME_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <array>
#include <vector>

namespace pwss {
namespace ws {

// ============================================================================
// RFC 6455 frame layout
// ============================================================================
//
//   0                   1                   2                   3
//   0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//  +-+-+-+-+-------+-+-------------+-------------------------------+
//  |F|R|R|R| opcode|M| Payload len |    Extended payload length    |
//  |I|S|S|S|  (4)  |A|     (7)     |             (16/64)           |
//  |N|V|V|V|       |S|             |   (if payload len==126/127)   |
//  | |1|2|3|       |K|             |                               |
//  +-+-+-+-+-------+-+-------------+ - - - - - - - - - - - - - - - +
//  |     Extended payload length continued, if payload len == 127  |
//  + - - - - - - - - - - - - - - - +-------------------------------+
//  |                               |Masking-key, if MASK set to 1  |
//  +-------------------------------+-------------------------------+
//  | Masking-key (continued)       |          Payload Data         |
//  +-------------------------------- - - - - - - - - - - - - - - - +

enum class OpCode : uint8_t {
  kContinuation = 0x0,
  kText = 0x1,
  kBinary = 0x2,
  kClose = 0x8,
  kPing = 0x9,
  kPong = 0xA
};

static constexpr size_t kMaxHeaderSize = 14;  // 2 + 8 extended length + 4 mask key
static constexpr uint8_t kLength16 = 126;
static constexpr uint8_t kLength64 = 127;

struct FrameHeader {
  bool fin = false;
  OpCode opcode = OpCode::kContinuation;
  bool masked = false;
  uint64_t payload_len = 0;
  std::array<uint8_t, 4> mask_key{};
};

// Writes a FIN-flagged header into buf (at least kMaxHeaderSize bytes).
// Returns the header length. Server frames are never masked.
size_t encode_frame_header(uint8_t* buf, OpCode opcode, uint64_t payload_len);

void unmask_payload(uint8_t* payload, size_t len, const uint8_t* mask_key);

// ============================================================================
// Inbound frames
// ============================================================================

enum class FrameKind : uint8_t { kData, kPing, kPong, kClose };

struct IncomingFrame {
  FrameKind kind = FrameKind::kData;
  bool fin = true;
  std::vector<uint8_t> payload;  // already unmasked
};

/**
 * @brief Blocking source of inbound bytes.
 *
 * read_exact() either fills all len bytes or fails; a failure leaves the
 * source unusable.
 */
class ByteSource {
 public:
  virtual ~ByteSource() = default;
  virtual expected<void, ErrorCode> read_exact(uint8_t* out, size_t len) = 0;
};

/**
 * @brief Reads one client frame:
 *        ReadHeader -> ReadExtendedLength -> ReadMaskKey -> ReadPayload -> Classify.
 *
 * Protocol violations: kUnmaskedFrame (mask bit clear), kPayloadTooLarge
 * (length above max_payload, detected before any payload byte is read),
 * kUnsupportedOpcode (text and reserved opcodes). I/O errors from the source
 * are passed through.
 */
expected<IncomingFrame, ErrorCode> read_frame(ByteSource& source, uint64_t max_payload);

}  // namespace ws
}  // namespace pwss

#endif  // PWSS_FRAME_HPP_
