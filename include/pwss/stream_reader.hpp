#ifndef PWSS_STREAM_READER_HPP_
#define PWSS_STREAM_READER_HPP_

#include "frame.hpp"
#include "ring_buffer.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <sockpp/tcp_socket.h>

namespace pwss {

// ============================================================================
// StreamReader - buffered read half of a client socket
// ============================================================================

/**
 * @brief Receives into a RingBuffer via readv and serves exact-length reads.
 *
 * The handshake phase uses fill() on a non-blocking socket and inspects the
 * buffer directly; after the upgrade the same reader (with any bytes the
 * client sent after the request head still buffered) serves read_exact() on
 * a blocking socket.
 */
class StreamReader : public ws::ByteSource {
 public:
  static constexpr size_t kBufferSize = 8192;
  using Buffer = RingBuffer<uint8_t, kBufferSize>;

  explicit StreamReader(sockpp::tcp_socket&& sock) : socket_(std::move(sock)) {}

  StreamReader(const StreamReader&) = delete;
  StreamReader& operator=(const StreamReader&) = delete;

  // One readv() into the free space. Returns the byte count; 0 means the
  // socket would block. Peer EOF is kConnectionClosed.
  expected<size_t, ErrorCode> fill();

  // Serves buffered bytes first, then blocks on the socket.
  expected<void, ErrorCode> read_exact(uint8_t* out, size_t len) override;

  Buffer& buffer() { return buffer_; }
  const Buffer& buffer() const { return buffer_; }

  sockpp::tcp_socket& socket() { return socket_; }
  int fd() const { return socket_.handle(); }

 private:
  static ErrorCode map_errno(int err);

  sockpp::tcp_socket socket_;
  Buffer buffer_;
};

}  // namespace pwss

#endif  // PWSS_STREAM_READER_HPP_
