#include "pwss/client_stream.hpp"

#include "pwss/log.hpp"

#include <cerrno>

#include <chrono>
#include <sys/socket.h>

namespace pwss {

namespace {

std::atomic<uint64_t> g_next_stream_id{1};

ErrorCode write_error(int err) {
  if (err == EPIPE || err == ECONNRESET) {
    return ErrorCode::kConnectionClosed;
  }
  return ErrorCode::kSocketError;
}

}  // namespace

ClientStream::ClientStream(std::unique_ptr<StreamReader> reader, std::string path, Protocol::Ptr incoming,
                           Protocol::Ptr outgoing, uint64_t max_payload_size)
    : id_(g_next_stream_id.fetch_add(1, std::memory_order_relaxed)),
      rx_(std::move(reader)),
      tx_(rx_->socket().clone()),
      path_(std::move(path)),
      incoming_(std::move(incoming)),
      outgoing_(std::move(outgoing)),
      max_payload_size_(max_payload_size) {
  if (!tx_.is_open()) {
    PWSS_LOG_ERROR("Stream " + std::to_string(id_) + ": failed to clone socket for writing");
  }
}

ClientStream::~ClientStream() {
  if (tx_.is_open()) {
    tx_.close();
  }
  if (rx_ && rx_->socket().is_open()) {
    rx_->socket().close();
  }
}

optional<Message> ClientStream::fail(ErrorCode code) {
  last_error_ = code;
  message_buf_.clear();
  switch (code) {
    case ErrorCode::kConnectionClosed:
      PWSS_LOG_DEBUG("Stream " + std::to_string(id_) + ": connection closed");
      break;
    case ErrorCode::kUnmaskedFrame:
    case ErrorCode::kUnsupportedOpcode:
    case ErrorCode::kPayloadTooLarge:
    case ErrorCode::kDecodeError:
      PWSS_LOG_WARN("Stream " + std::to_string(id_) + ": " + error_string(code));
      break;
    default:
      PWSS_LOG_DEBUG("Stream " + std::to_string(id_) + ": read failed: " + error_string(code));
      break;
  }
  return optional<Message>();
}

optional<Message> ClientStream::read() {
  if (is_closed()) {
    return fail(ErrorCode::kConnectionClosed);
  }

  message_buf_.clear();
  for (;;) {
    auto frame = ws::read_frame(*rx_, max_payload_size_);
    if (!frame) {
      return fail(frame.get_error());
    }

    ws::IncomingFrame& f = frame.value();
    switch (f.kind) {
      case ws::FrameKind::kPing:
      case ws::FrameKind::kPong:
        continue;

      case ws::FrameKind::kClose: {
        closed_.store(true, std::memory_order_release);
        auto r = write_frame(ws::OpCode::kClose, nullptr, 0);
        if (!r) {
          PWSS_LOG_DEBUG("Stream " + std::to_string(id_) + ": close reply failed: " + error_string(r.get_error()));
        }
        return fail(ErrorCode::kConnectionClosed);
      }

      case ws::FrameKind::kData:
        message_buf_.insert(message_buf_.end(), f.payload.begin(), f.payload.end());
        if (!f.fin) {
          continue;
        }
        break;
    }

    auto msg = incoming_->decode(message_buf_);
    message_buf_.clear();
    if (!msg) {
      return fail(msg.get_error());
    }
    last_error_ = ErrorCode::kOk;
    return optional<Message>(std::move(msg.value()));
  }
}

expected<void, ErrorCode> ClientStream::send(const Message& message) {
  if (is_closed()) {
    return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  auto bytes = outgoing_->encode(message);
  if (!bytes) {
    PWSS_LOG_WARN("Stream " + std::to_string(id_) + ": message does not match protocol " + outgoing_->name());
    return expected<void, ErrorCode>::error(bytes.get_error());
  }
  return write_frame(ws::OpCode::kBinary, bytes.value().data(), bytes.value().size());
}

expected<void, ErrorCode> ClientStream::write_frame(ws::OpCode opcode, const uint8_t* payload, size_t len) {
  std::lock_guard<std::mutex> lock(tx_mutex_);
  if (!tx_.is_open()) {
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }

  uint8_t header[ws::kMaxHeaderSize];
  size_t header_len = ws::encode_frame_header(header, opcode, len);

  ssize_t n = tx_.write_n(header, header_len);
  if (n < 0 || static_cast<size_t>(n) != header_len) {
    return expected<void, ErrorCode>::error(write_error(errno));
  }
  if (len > 0) {
    n = tx_.write_n(payload, len);
    if (n < 0 || static_cast<size_t>(n) != len) {
      return expected<void, ErrorCode>::error(write_error(errno));
    }
  }
  return expected<void, ErrorCode>::success();
}

void ClientStream::shutdown() {
  bool was_closed = false;
  if (!closed_.compare_exchange_strong(was_closed, true, std::memory_order_acq_rel)) {
    return;
  }

  auto r = write_frame(ws::OpCode::kClose, nullptr, 0);
  if (!r) {
    PWSS_LOG_DEBUG("Stream " + std::to_string(id_) + ": close frame failed: " + error_string(r.get_error()));
  }
  {
    std::lock_guard<std::mutex> lock(tx_mutex_);
    if (tx_.is_open()) {
      tx_.shutdown(SHUT_WR);
    }
  }

  // Bounded drain so an unresponsive peer cannot hold the caller.
  rx_->socket().read_timeout(std::chrono::milliseconds(kShutdownDrainTimeoutMs));
  for (int i = 0; i < kShutdownDrainFrames; ++i) {
    auto frame = ws::read_frame(*rx_, max_payload_size_);
    if (!frame || frame.value().kind == ws::FrameKind::kClose) {
      break;
    }
  }
}

}  // namespace pwss
