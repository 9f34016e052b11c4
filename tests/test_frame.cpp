#include "pwss/frame.hpp"

#include <cstring>
#include <vector>

#include <catch2/catch.hpp>

using namespace pwss;

namespace {

// Serves bytes from memory; counts how many were consumed.
class MemorySource : public ws::ByteSource {
 public:
  explicit MemorySource(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

  expected<void, ErrorCode> read_exact(uint8_t* out, size_t len) override {
    if (bytes_.size() - pos_ < len) {
      pos_ = bytes_.size();
      return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
    }
    std::memcpy(out, bytes_.data() + pos_, len);
    pos_ += len;
    return expected<void, ErrorCode>::success();
  }

  size_t consumed() const { return pos_; }

 private:
  std::vector<uint8_t> bytes_;
  size_t pos_ = 0;
};

const uint8_t kMask[4] = {0x37, 0xfa, 0x21, 0x3d};

// Client-side frame: masked with kMask.
std::vector<uint8_t> client_frame(uint8_t first_byte, const std::vector<uint8_t>& payload) {
  std::vector<uint8_t> out;
  out.push_back(first_byte);
  if (payload.size() < 126) {
    out.push_back(static_cast<uint8_t>(0x80 | payload.size()));
  } else if (payload.size() <= 0xFFFF) {
    out.push_back(0x80 | 126);
    out.push_back(static_cast<uint8_t>(payload.size() >> 8));
    out.push_back(static_cast<uint8_t>(payload.size() & 0xFF));
  } else {
    out.push_back(0x80 | 127);
    for (int i = 7; i >= 0; --i) {
      out.push_back(static_cast<uint8_t>((static_cast<uint64_t>(payload.size()) >> (i * 8)) & 0xFF));
    }
  }
  out.insert(out.end(), kMask, kMask + 4);
  for (size_t i = 0; i < payload.size(); ++i) {
    out.push_back(payload[i] ^ kMask[i % 4]);
  }
  return out;
}

}  // namespace

// ============================================================================
// Frame Reading
// ============================================================================

TEST_CASE("Frame read - masked binary frame", "[frame]") {
  MemorySource src(client_frame(0x82, {'H', 'e', 'l', 'l', 'o'}));
  auto r = ws::read_frame(src, 65536);
  REQUIRE(r.has_value());
  REQUIRE(r.value().kind == ws::FrameKind::kData);
  REQUIRE(r.value().fin == true);
  REQUIRE(r.value().payload == std::vector<uint8_t>{'H', 'e', 'l', 'l', 'o'});
}

TEST_CASE("Frame read - RFC 6455 masked sample", "[frame]") {
  // "Hello" masked with 0x37fa213d, opcode changed to binary
  MemorySource src({0x82, 0x85, 0x37, 0xfa, 0x21, 0x3d, 0x7f, 0x9f, 0x4d, 0x51, 0x58});
  auto r = ws::read_frame(src, 65536);
  REQUIRE(r.has_value());
  std::string text(r.value().payload.begin(), r.value().payload.end());
  REQUIRE(text == "Hello");
}

TEST_CASE("Frame read - continuation frame keeps fin flag", "[frame]") {
  MemorySource src(client_frame(0x02, {'a', 'b', 'c'}));  // FIN=0, binary
  auto r = ws::read_frame(src, 65536);
  REQUIRE(r.has_value());
  REQUIRE(r.value().kind == ws::FrameKind::kData);
  REQUIRE(r.value().fin == false);

  MemorySource cont(client_frame(0x80, {'d'}));  // FIN=1, continuation
  r = ws::read_frame(cont, 65536);
  REQUIRE(r.has_value());
  REQUIRE(r.value().kind == ws::FrameKind::kData);
  REQUIRE(r.value().fin == true);
}

TEST_CASE("Frame read - control frames are classified", "[frame]") {
  MemorySource ping(client_frame(0x89, {}));
  auto r = ws::read_frame(ping, 65536);
  REQUIRE(r.has_value());
  REQUIRE(r.value().kind == ws::FrameKind::kPing);
  REQUIRE(r.value().payload.empty());

  MemorySource pong(client_frame(0x8A, {'t', 'e', 's', 't'}));
  r = ws::read_frame(pong, 65536);
  REQUIRE(r.has_value());
  REQUIRE(r.value().kind == ws::FrameKind::kPong);

  MemorySource close(client_frame(0x88, {0x03, 0xE8}));
  r = ws::read_frame(close, 65536);
  REQUIRE(r.has_value());
  REQUIRE(r.value().kind == ws::FrameKind::kClose);
}

TEST_CASE("Frame read - unmasked frame rejected after header", "[frame]") {
  MemorySource src({0x82, 0x03, 0x01, 0x02, 0x03});
  auto r = ws::read_frame(src, 65536);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == ErrorCode::kUnmaskedFrame);
  REQUIRE(src.consumed() == 2);
}

TEST_CASE("Frame read - text opcode unsupported", "[frame]") {
  MemorySource src(client_frame(0x81, {'h', 'i'}));
  auto r = ws::read_frame(src, 65536);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == ErrorCode::kUnsupportedOpcode);
}

TEST_CASE("Frame read - reserved opcode unsupported", "[frame]") {
  MemorySource src(client_frame(0x83, {}));
  auto r = ws::read_frame(src, 65536);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == ErrorCode::kUnsupportedOpcode);
}

TEST_CASE("Frame read - 16-bit extended length", "[frame]") {
  std::vector<uint8_t> payload(200, 'x');
  MemorySource src(client_frame(0x82, payload));
  auto r = ws::read_frame(src, 65536);
  REQUIRE(r.has_value());
  REQUIRE(r.value().payload == payload);
}

TEST_CASE("Frame read - 64-bit extended length", "[frame]") {
  std::vector<uint8_t> payload(70000, 0x5A);
  MemorySource src(client_frame(0x82, payload));
  auto r = ws::read_frame(src, 1 << 20);
  REQUIRE(r.has_value());
  REQUIRE(r.value().payload.size() == 70000);
  REQUIRE(r.value().payload == payload);
}

TEST_CASE("Frame read - payload above cap rejected before payload", "[frame]") {
  std::vector<uint8_t> payload(300, 'x');
  MemorySource src(client_frame(0x82, payload));
  auto r = ws::read_frame(src, 100);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == ErrorCode::kPayloadTooLarge);
  // 2 header + 2 extended length + 4 mask key, no payload
  REQUIRE(src.consumed() == 8);
}

TEST_CASE("Frame read - payload equal to cap accepted", "[frame]") {
  std::vector<uint8_t> payload(100, 'x');
  MemorySource src(client_frame(0x82, payload));
  auto r = ws::read_frame(src, 100);
  REQUIRE(r.has_value());
}

TEST_CASE("Frame read - truncated frame reports source error", "[frame]") {
  MemorySource header_only({0x82});
  auto r = ws::read_frame(header_only, 65536);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == ErrorCode::kConnectionClosed);

  MemorySource short_payload({0x82, 0x85, 0x37, 0xfa, 0x21, 0x3d, 0x7f});
  r = ws::read_frame(short_payload, 65536);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == ErrorCode::kConnectionClosed);
}

// ============================================================================
// Frame Header Encoding
// ============================================================================

TEST_CASE("Frame encode - small binary header", "[frame]") {
  uint8_t buf[ws::kMaxHeaderSize];
  size_t n = ws::encode_frame_header(buf, ws::OpCode::kBinary, 5);
  REQUIRE(n == 2);
  REQUIRE(buf[0] == 0x82);
  REQUIRE(buf[1] == 5);  // no mask bit
}

TEST_CASE("Frame encode - 125 bytes stays inline", "[frame]") {
  uint8_t buf[ws::kMaxHeaderSize];
  REQUIRE(ws::encode_frame_header(buf, ws::OpCode::kBinary, 125) == 2);
  REQUIRE(buf[1] == 125);
}

TEST_CASE("Frame encode - 16-bit length tier", "[frame]") {
  uint8_t buf[ws::kMaxHeaderSize];
  size_t n = ws::encode_frame_header(buf, ws::OpCode::kBinary, 126);
  REQUIRE(n == 4);
  REQUIRE(buf[1] == 126);
  REQUIRE(buf[2] == 0x00);
  REQUIRE(buf[3] == 126);

  n = ws::encode_frame_header(buf, ws::OpCode::kBinary, 65535);
  REQUIRE(n == 4);
  REQUIRE(buf[2] == 0xFF);
  REQUIRE(buf[3] == 0xFF);
}

TEST_CASE("Frame encode - 64-bit length tier above 65535", "[frame]") {
  uint8_t buf[ws::kMaxHeaderSize];
  size_t n = ws::encode_frame_header(buf, ws::OpCode::kBinary, 65536);
  REQUIRE(n == 10);
  REQUIRE(buf[0] == 0x82);
  REQUIRE(buf[1] == 127);
  const uint8_t expected_len[8] = {0, 0, 0, 0, 0, 1, 0, 0};
  REQUIRE(std::memcmp(buf + 2, expected_len, 8) == 0);
}

TEST_CASE("Frame encode - close frame", "[frame]") {
  uint8_t buf[ws::kMaxHeaderSize];
  size_t n = ws::encode_frame_header(buf, ws::OpCode::kClose, 0);
  REQUIRE(n == 2);
  REQUIRE(buf[0] == 0x88);
  REQUIRE(buf[1] == 0x00);
}

// ============================================================================
// Unmask
// ============================================================================

TEST_CASE("Unmask payload - 'Hello'", "[frame]") {
  uint8_t masked[] = {0x7f, 0x9f, 0x4d, 0x51, 0x58};
  ws::unmask_payload(masked, sizeof(masked), kMask);
  std::string result(reinterpret_cast<const char*>(masked), sizeof(masked));
  REQUIRE(result == "Hello");
}

TEST_CASE("Unmask payload - applying twice restores input", "[frame]") {
  std::string original = "WebSocket test message!";
  uint8_t key[] = {0xAB, 0xCD, 0xEF, 0x01};
  std::vector<uint8_t> data(original.begin(), original.end());
  ws::unmask_payload(data.data(), data.size(), key);
  REQUIRE(std::string(data.begin(), data.end()) != original);
  ws::unmask_payload(data.data(), data.size(), key);
  REQUIRE(std::string(data.begin(), data.end()) == original);
}
