#ifndef PWSS_CLIENT_STREAM_HPP_
#define PWSS_CLIENT_STREAM_HPP_

#include "frame.hpp"
#include "protocol.hpp"
#include "stream_reader.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <sockpp/tcp_socket.h>

namespace pwss {

// ============================================================================
// ClientStream - one upgraded WebSocket connection
// ============================================================================

/**
 * @brief Typed message stream over an upgraded connection.
 *
 * The read half (read(), shutdown()) belongs to one thread; send() may be
 * called from any thread. Writes are serialized, so a close reply sent by the
 * reader never interleaves with an outbound frame. Destroying the stream
 * closes the socket.
 */
class ClientStream {
 public:
  static constexpr int kShutdownDrainFrames = 10;
  static constexpr int kShutdownDrainTimeoutMs = 2000;

  ClientStream(std::unique_ptr<StreamReader> reader, std::string path, Protocol::Ptr incoming,
               Protocol::Ptr outgoing, uint64_t max_payload_size);
  ~ClientStream();

  ClientStream(const ClientStream&) = delete;
  ClientStream& operator=(const ClientStream&) = delete;

  /**
   * @brief Blocks until one complete message arrives.
   *
   * Fragments are reassembled; ping and pong frames are dropped. Returns an
   * empty optional on a close frame (after replying with close), on any
   * protocol violation or I/O error, and on a payload that does not decode.
   * The reason is available from last_error().
   */
  optional<Message> read();

  // Encodes with the outbound protocol and writes one binary frame.
  expected<void, ErrorCode> send(const Message& message);

  /**
   * @brief Sends close, shuts the write half and drains up to
   *        kShutdownDrainFrames inbound frames. Idempotent.
   *
   * Must not run concurrently with read().
   */
  void shutdown();

  uint64_t get_id() const { return id_; }
  const std::string& path() const { return path_; }
  bool is_closed() const { return closed_.load(std::memory_order_acquire); }
  ErrorCode last_error() const { return last_error_; }

  const Protocol& incoming() const { return *incoming_; }
  const Protocol& outgoing() const { return *outgoing_; }

 private:
  expected<void, ErrorCode> write_frame(ws::OpCode opcode, const uint8_t* payload, size_t len);
  optional<Message> fail(ErrorCode code);

  uint64_t id_;
  std::unique_ptr<StreamReader> rx_;
  sockpp::tcp_socket tx_;
  std::mutex tx_mutex_;
  std::atomic<bool> closed_{false};
  ErrorCode last_error_ = ErrorCode::kOk;

  std::string path_;
  Protocol::Ptr incoming_;
  Protocol::Ptr outgoing_;
  uint64_t max_payload_size_;

  std::vector<uint8_t> message_buf_;
};

}  // namespace pwss

#endif  // PWSS_CLIENT_STREAM_HPP_
