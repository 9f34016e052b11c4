#ifndef PWSS_SERVER_HPP_
#define PWSS_SERVER_HPP_

#include "client_stream.hpp"
#include "handshake.hpp"
#include "protocol.hpp"
#include "ring_buffer.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <array>
#include <atomic>
#include <deque>
#include <memory>
#include <poll.h>
#include <string>

namespace pwss {

// Accepting server: a poll() reactor that multiplexes pending handshakes and
// hands out upgraded ClientStreams.

// ============================================================================
// TCP Tuning Configuration
// ============================================================================

struct TcpTuning {
  bool tcp_nodelay = false;   // Disable Nagle algorithm
  bool tcp_quickack = false;  // Reduce ACK delay (Linux-specific)
  bool so_keepalive = false;  // Enable TCP keepalive

  // Keepalive parameters (Linux-specific, effective when so_keepalive=true)
  int keepalive_idle_s = 60;
  int keepalive_interval_s = 10;
  int keepalive_count = 5;
};

// ============================================================================
// Server configuration
// ============================================================================

struct ServerConfig {
  uint16_t port = 8080;
  std::string bind_address;  // empty = INADDR_ANY
  std::string name = "pwss";  // application_name in the manifest

  uint64_t max_payload_size = 65536;
  uint32_t max_pending_handshakes = 64;
  int poll_timeout_ms = 100;
  int handshake_timeout_ms = 0;  // 0 = no deadline
  int read_timeout_ms = 0;       // 0 = no deadline (SO_RCVTIMEO on streams)

  TcpTuning tcp_tuning;
};

// ============================================================================
// ServerStats - Atomic counters
// ============================================================================

struct alignas(kCacheLine) ServerStats {
  std::atomic<uint64_t> total_connections{0};
  std::atomic<uint64_t> upgraded_streams{0};
  std::atomic<uint64_t> manifest_requests{0};
  std::atomic<uint64_t> rejected_connections{0};

  std::atomic<uint64_t> handshake_errors{0};
  std::atomic<uint64_t> socket_errors{0};

  void reset() {
    total_connections = 0;
    upgraded_streams = 0;
    manifest_requests = 0;
    rejected_connections = 0;
    handshake_errors = 0;
    socket_errors = 0;
  }
};

// ============================================================================
// Server
// ============================================================================

class Server {
 public:
  using StreamPtr = std::shared_ptr<ClientStream>;

  // Compile-time ceiling for max_pending_handshakes.
  static constexpr uint32_t kMaxPendingHandshakes = 64;

  // Throws std::runtime_error when the listener cannot be set up.
  Server(const ServerConfig& config, Protocol::Ptr incoming, Protocol::Ptr outgoing);
  Server(uint16_t port, const std::string& name, Protocol::Ptr incoming, Protocol::Ptr outgoing);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  /**
   * @brief Blocks until a client completes the WebSocket handshake.
   *
   * Returns nullptr once stop() has been called (within one poll interval)
   * or when poll() fails.
   */
  StreamPtr accept();

  // Thread-safe.
  void stop() { stopped_.store(true, std::memory_order_release); }
  bool is_stopped() const { return stopped_.load(std::memory_order_acquire); }

  // Configuration
  Server& set_max_pending_handshakes(uint32_t max) {
    config_.max_pending_handshakes = max < kMaxPendingHandshakes ? max : kMaxPendingHandshakes;
    return *this;
  }

  Server& set_poll_timeout_ms(int timeout) {
    config_.poll_timeout_ms = timeout;
    return *this;
  }

  Server& set_handshake_timeout_ms(int timeout) {
    config_.handshake_timeout_ms = timeout;
    return *this;
  }

  Server& set_read_timeout_ms(int timeout) {
    config_.read_timeout_ms = timeout;
    return *this;
  }

  Server& set_max_payload_size(uint64_t size) {
    config_.max_payload_size = size;
    return *this;
  }

  Server& set_tcp_tuning(const TcpTuning& tuning) {
    config_.tcp_tuning = tuning;
    return *this;
  }

  const ServerConfig& config() const { return config_; }
  uint16_t port() const { return port_; }
  const std::string& manifest_document() const { return manifest_document_; }
  uint32_t pending_handshakes() const { return pending_.size(); }

  const ServerStats& stats() const { return stats_; }
  void reset_stats() { stats_.reset(); }

 private:
  void accept_connection();
  void handle_handshake(uint32_t index);
  void expire_handshakes();
  void apply_tcp_tuning(int fd);

  ServerConfig config_;
  Protocol::Ptr incoming_;
  Protocol::Ptr outgoing_;
  std::string manifest_document_;

  int server_sock_ = -1;
  uint16_t port_ = 0;
  std::atomic<bool> stopped_{false};

  FixedVector<std::unique_ptr<PendingHandshake>, kMaxPendingHandshakes> pending_;
  std::deque<StreamPtr> ready_;

  // 1 for the listener + kMaxPendingHandshakes
  std::array<pollfd, kMaxPendingHandshakes + 1> poll_fds_{};

  ServerStats stats_;
};

}  // namespace pwss

#endif  // PWSS_SERVER_HPP_
