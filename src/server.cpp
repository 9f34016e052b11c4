#include "pwss/server.hpp"

#include "pwss/log.hpp"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

#include <sockpp/socket.h>

namespace pwss {

Server::Server(const ServerConfig& config, Protocol::Ptr incoming, Protocol::Ptr outgoing)
    : config_(config), incoming_(std::move(incoming)), outgoing_(std::move(outgoing)) {
  if (!incoming_ || !outgoing_) {
    PWSS_THROW(std::invalid_argument("Server requires incoming and outgoing protocols"));
  }
  if (config_.max_pending_handshakes > kMaxPendingHandshakes || config_.max_pending_handshakes == 0) {
    config_.max_pending_handshakes = kMaxPendingHandshakes;
  }
  manifest_document_ = build_manifest_document(config_.name, *incoming_, *outgoing_);

  // Ignores SIGPIPE so a vanished peer surfaces as a write error.
  sockpp::initialize();

  server_sock_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (server_sock_ < 0) {
    PWSS_THROW(std::runtime_error("Failed to create socket"));
  }

  int reuse = 1;
  setsockopt(server_sock_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(config_.port);
  if (config_.bind_address.empty()) {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, config_.bind_address.c_str(), &addr.sin_addr) != 1) {
    ::close(server_sock_);
    PWSS_THROW(std::runtime_error("Invalid bind address " + config_.bind_address));
  }

  if (bind(server_sock_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    ::close(server_sock_);
    PWSS_THROW(std::runtime_error("Failed to bind port " + std::to_string(config_.port) + ": " + strerror(err)));
  }

  if (listen(server_sock_, 128) < 0) {
    ::close(server_sock_);
    PWSS_THROW(std::runtime_error("Failed to listen"));
  }

  fcntl(server_sock_, F_SETFL, O_NONBLOCK);

  socklen_t addr_len = sizeof(addr);
  if (getsockname(server_sock_, reinterpret_cast<struct sockaddr*>(&addr), &addr_len) == 0) {
    port_ = ntohs(addr.sin_port);
  } else {
    port_ = config_.port;
  }

  PWSS_LOG_INFO("Server '" + config_.name + "' listening on " +
                (config_.bind_address.empty() ? std::string("0.0.0.0") : config_.bind_address) + ":" +
                std::to_string(port_));
}

Server::Server(uint16_t port, const std::string& name, Protocol::Ptr incoming, Protocol::Ptr outgoing)
    : Server(
          [&] {
            ServerConfig config;
            config.port = port;
            config.name = name;
            return config;
          }(),
          std::move(incoming), std::move(outgoing)) {}

Server::~Server() {
  pending_.clear();
  if (server_sock_ >= 0) {
    ::close(server_sock_);
  }
}

Server::StreamPtr Server::accept() {
  while (!is_stopped()) {
    if (!ready_.empty()) {
      StreamPtr stream = std::move(ready_.front());
      ready_.pop_front();
      return stream;
    }

    // The listener is always watched, so an empty handshake set never spins.
    size_t nfds = 0;
    poll_fds_[nfds++] = {server_sock_, POLLIN, 0};
    for (uint32_t i = 0; i < pending_.size(); ++i) {
      short events = pending_[i]->writing() ? POLLOUT : POLLIN;
      poll_fds_[nfds++] = {pending_[i]->fd(), events, 0};
    }

    int ret = ::poll(poll_fds_.data(), static_cast<nfds_t>(nfds), config_.poll_timeout_ms);
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      PWSS_LOG_ERROR(std::string("Poll error: ") + strerror(errno));
      stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
      return nullptr;
    }

    if (ret > 0) {
      // Walk handshakes from the back: erase_unordered() only moves the
      // last element, which has already been visited.
      for (size_t i = nfds - 1; i >= 1; --i) {
        if (poll_fds_[i].revents != 0) {
          handle_handshake(static_cast<uint32_t>(i - 1));
        }
      }
      if (poll_fds_[0].revents & POLLIN) {
        accept_connection();
      }
    }

    expire_handshakes();
  }
  return nullptr;
}

void Server::handle_handshake(uint32_t index) {
  auto& hs = pending_[index];
  auto status = hs->writing() ? hs->on_writable() : hs->on_readable(manifest_document_);
  switch (status) {
    case PendingHandshake::Status::kPending:
      return;

    case PendingHandshake::Status::kUpgraded: {
      std::string path = hs->path();
      auto reader = hs->release_reader();
      if (config_.read_timeout_ms > 0) {
        reader->socket().read_timeout(std::chrono::milliseconds(config_.read_timeout_ms));
      }
      ready_.push_back(std::make_shared<ClientStream>(std::move(reader), std::move(path), incoming_, outgoing_,
                                                      config_.max_payload_size));
      stats_.upgraded_streams.fetch_add(1, std::memory_order_relaxed);
      break;
    }

    case PendingHandshake::Status::kManifestServed:
      stats_.manifest_requests.fetch_add(1, std::memory_order_relaxed);
      break;

    case PendingHandshake::Status::kRejected:
      stats_.handshake_errors.fetch_add(1, std::memory_order_relaxed);
      break;
  }
  pending_.erase_unordered(index);
}

void Server::expire_handshakes() {
  if (config_.handshake_timeout_ms <= 0) {
    return;
  }
  uint32_t i = 0;
  while (i < pending_.size()) {
    if (pending_[i]->timed_out(config_.handshake_timeout_ms)) {
      PWSS_LOG_WARN("Handshake timed out");
      stats_.handshake_errors.fetch_add(1, std::memory_order_relaxed);
      pending_.erase_unordered(i);
    } else {
      ++i;
    }
  }
}

void Server::accept_connection() {
  struct sockaddr_in client_addr;
  socklen_t client_addr_len = sizeof(client_addr);
  int client_sock = ::accept(server_sock_, reinterpret_cast<struct sockaddr*>(&client_addr), &client_addr_len);

  if (client_sock < 0) {
    int err = errno;
    if (err != EAGAIN && err != EWOULDBLOCK && err != EINTR) {
      PWSS_LOG_ERROR(std::string("Accept error: ") + strerror(err));
      stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
    }
    return;
  }

  // Overload: accept and immediately close to drain the backlog.
  if (pending_.size() >= config_.max_pending_handshakes || pending_.full()) {
    PWSS_LOG_WARN("Too many pending handshakes, dropping connection");
    stats_.rejected_connections.fetch_add(1, std::memory_order_relaxed);
    ::close(client_sock);
    return;
  }

  apply_tcp_tuning(client_sock);
  pending_.push_back(std::unique_ptr<PendingHandshake>(new PendingHandshake(sockpp::tcp_socket(client_sock))));
  stats_.total_connections.fetch_add(1, std::memory_order_relaxed);
}

void Server::apply_tcp_tuning(int fd) {
  const TcpTuning& tuning = config_.tcp_tuning;
  int opt = 1;

  if (tuning.tcp_nodelay) {
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
  }

#ifdef TCP_QUICKACK
  if (tuning.tcp_quickack) {
    setsockopt(fd, IPPROTO_TCP, TCP_QUICKACK, &opt, sizeof(opt));
  }
#endif

  if (tuning.so_keepalive) {
    setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));

#ifdef TCP_KEEPIDLE
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &tuning.keepalive_idle_s, sizeof(tuning.keepalive_idle_s));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &tuning.keepalive_interval_s, sizeof(tuning.keepalive_interval_s));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &tuning.keepalive_count, sizeof(tuning.keepalive_count));
#endif
  }
}

}  // namespace pwss
