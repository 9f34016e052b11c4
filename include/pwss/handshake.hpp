#ifndef PWSS_HANDSHAKE_HPP_
#define PWSS_HANDSHAKE_HPP_

#include "protocol.hpp"
#include "stream_reader.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include <sockpp/tcp_socket.h>

namespace pwss {

// ============================================================================
// HTTP request head
// ============================================================================

// Header names are stored lower-cased, values trimmed.
using HeaderMap = std::unordered_map<std::string, std::string>;

struct HttpRequest {
  std::string method;
  std::string uri;
  std::string version;
  HeaderMap headers;

  // Empty string when absent. name must be lower-case.
  const std::string& header(const std::string& name) const;
};

static constexpr const char* kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
static constexpr const char* kManifestPath = "/manifest";

// Length of the request head including the blank line ("\r\n\r\n" or
// "\n\n"), or 0 while incomplete.
size_t find_request_end(std::string_view data);

// Returns false when the request line is empty.
bool parse_request(std::string_view head, HttpRequest& out);

// base64(sha1(key + GUID))
std::string compute_accept_key(std::string_view client_key);

enum class HandshakeVerdict : uint8_t {
  kUpgrade,
  kManifest,
  kBadHttpVersion,   // 400
  kNotAnUpgrade,     // 418
  kBadWsVersion,     // 400 + Sec-WebSocket-Version: 13
  kMissingKey,       // 400
  kRequestTooLarge,  // 400
};

HandshakeVerdict validate_request(const HttpRequest& req);

/**
 * @brief Full HTTP response for a verdict.
 *
 * @param manifest_document body served for kManifest
 */
std::string build_response(HandshakeVerdict verdict, const HttpRequest& req,
                           const std::string& manifest_document);

// {"application_name":..,"incoming_protocol":..,"outgoing_protocol":..}
std::string build_manifest_document(const std::string& application_name, const Protocol& incoming,
                                    const Protocol& outgoing);

// ============================================================================
// PendingHandshake - one non-blocking connection awaiting its request head
// ============================================================================

class PendingHandshake {
 public:
  enum class Status : uint8_t { kPending, kUpgraded, kManifestServed, kRejected };

  explicit PendingHandshake(sockpp::tcp_socket&& sock);

  /**
   * @brief Reads what is available and, once the head is complete, answers it.
   *
   * The response goes out without blocking; whatever the socket does not take
   * stays queued (writing() is true) and on_writable() continues it. After
   * kUpgraded the socket is blocking again and the reader (holding any bytes
   * sent past the head) and path() are ready to be moved into a ClientStream.
   * Every other terminal status leaves the socket to be closed with this object.
   */
  Status on_readable(const std::string& manifest_document);

  // Continues a queued response. kPending while bytes remain.
  Status on_writable();

  bool writing() const { return out_pos_ < outbox_.size(); }
  bool timed_out(int timeout_ms) const;

  int fd() const { return reader_->fd(); }
  const std::string& path() const { return request_.uri; }
  HandshakeVerdict verdict() const { return verdict_; }

  std::unique_ptr<StreamReader> release_reader() { return std::move(reader_); }

 private:
  Status respond(HandshakeVerdict verdict, const std::string& manifest_document);
  Status flush();

  std::unique_ptr<StreamReader> reader_;
  HttpRequest request_;
  HandshakeVerdict verdict_ = HandshakeVerdict::kBadHttpVersion;
  std::chrono::steady_clock::time_point started_;

  std::string outbox_;
  size_t out_pos_ = 0;
};

}  // namespace pwss

#endif  // PWSS_HANDSHAKE_HPP_
