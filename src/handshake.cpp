#include "pwss/handshake.hpp"

#include "pwss/log.hpp"
#include "pwss/utils.hpp"

#include <cerrno>

#include <nlohmann/json.hpp>

namespace pwss {

namespace {

const std::string kEmpty;

std::string_view next_token(std::string_view& line) {
  size_t start = line.find_first_not_of(" \t");
  if (start == std::string_view::npos) {
    line = std::string_view();
    return std::string_view();
  }
  size_t end = line.find_first_of(" \t", start);
  std::string_view token = line.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
  line = end == std::string_view::npos ? std::string_view() : line.substr(end);
  return token;
}

std::string make_response(const char* status, const std::string& extra_headers, const std::string& body,
                          const char* content_type = "text/plain") {
  std::string resp = "HTTP/1.1 ";
  resp += status;
  resp += "\r\nContent-Type: ";
  resp += content_type;
  resp += "\r\n";
  resp += extra_headers;
  resp += "Content-Length: " + std::to_string(body.size()) + "\r\n";
  resp += "Connection: close\r\n\r\n";
  resp += body;
  return resp;
}

const char* verdict_name(HandshakeVerdict verdict) {
  switch (verdict) {
    case HandshakeVerdict::kUpgrade:
      return "upgrade";
    case HandshakeVerdict::kManifest:
      return "manifest";
    case HandshakeVerdict::kBadHttpVersion:
      return "unsupported HTTP version";
    case HandshakeVerdict::kNotAnUpgrade:
      return "not a websocket upgrade";
    case HandshakeVerdict::kBadWsVersion:
      return "unsupported Sec-WebSocket-Version";
    case HandshakeVerdict::kMissingKey:
      return "missing Sec-WebSocket-Key";
    case HandshakeVerdict::kRequestTooLarge:
      return "request head too large";
  }
  return "unknown";
}

}  // namespace

// ============================================================================
// Request parsing
// ============================================================================

const std::string& HttpRequest::header(const std::string& name) const {
  auto it = headers.find(name);
  return it == headers.end() ? kEmpty : it->second;
}

size_t find_request_end(std::string_view data) {
  size_t crlf = data.find("\r\n\r\n");
  size_t lf = data.find("\n\n");
  size_t end = 0;
  if (crlf != std::string_view::npos) {
    end = crlf + 4;
  }
  if (lf != std::string_view::npos && (end == 0 || lf + 2 < end)) {
    end = lf + 2;
  }
  return end;
}

bool parse_request(std::string_view head, HttpRequest& out) {
  out = HttpRequest();
  bool first = true;
  while (!head.empty()) {
    size_t nl = head.find('\n');
    std::string_view line = head.substr(0, nl);
    head = nl == std::string_view::npos ? std::string_view() : head.substr(nl + 1);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }

    if (first) {
      first = false;
      out.method = std::string(next_token(line));
      out.uri = std::string(next_token(line));
      out.version = std::string(next_token(line));
      if (out.method.empty()) {
        return false;
      }
      continue;
    }

    if (line.empty()) {
      break;
    }
    size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
      continue;
    }
    out.headers[to_lower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
  }
  return !first;
}

std::string compute_accept_key(std::string_view client_key) {
  std::string combined(client_key);
  combined += kWebSocketGuid;
  auto digest = SHA1::compute(reinterpret_cast<const uint8_t*>(combined.data()), combined.size());
  return Base64::encode(digest.data(), digest.size());
}

HandshakeVerdict validate_request(const HttpRequest& req) {
  if (req.version != "HTTP/1.1") {
    return HandshakeVerdict::kBadHttpVersion;
  }
  if (req.uri == kManifestPath) {
    return HandshakeVerdict::kManifest;
  }
  if (!icontains(req.header("connection"), "upgrade") || !iequals(req.header("upgrade"), "websocket")) {
    return HandshakeVerdict::kNotAnUpgrade;
  }
  if (req.header("sec-websocket-version") != "13") {
    return HandshakeVerdict::kBadWsVersion;
  }
  if (req.header("sec-websocket-key").empty()) {
    return HandshakeVerdict::kMissingKey;
  }
  return HandshakeVerdict::kUpgrade;
}

std::string build_response(HandshakeVerdict verdict, const HttpRequest& req,
                           const std::string& manifest_document) {
  switch (verdict) {
    case HandshakeVerdict::kUpgrade:
      return "HTTP/1.1 101 Switching Protocols\r\n"
             "Connection: Upgrade\r\n"
             "Upgrade: websocket\r\n"
             "Sec-WebSocket-Accept: " +
             compute_accept_key(req.header("sec-websocket-key")) + "\r\n\r\n";
    case HandshakeVerdict::kManifest:
      return make_response("200 OK", "Access-Control-Allow-Origin: *\r\n", manifest_document,
                           "application/json");
    case HandshakeVerdict::kBadHttpVersion:
      return make_response("400 Bad Request", "", "Only HTTP/1.1 is supported\n");
    case HandshakeVerdict::kNotAnUpgrade:
      return make_response("418 I'm a Teapot", "",
                           "This server only speaks WebSocket; send Connection: Upgrade and Upgrade: websocket\n");
    case HandshakeVerdict::kBadWsVersion:
      return make_response("400 Bad Request", "Sec-WebSocket-Version: 13\r\n",
                           "Unsupported Sec-WebSocket-Version\n");
    case HandshakeVerdict::kMissingKey:
      return make_response("400 Bad Request", "", "Missing Sec-WebSocket-Key\n");
    case HandshakeVerdict::kRequestTooLarge:
      return make_response("400 Bad Request", "", "Request head too large\n");
  }
  return make_response("400 Bad Request", "", "");
}

std::string build_manifest_document(const std::string& application_name, const Protocol& incoming,
                                    const Protocol& outgoing) {
  nlohmann::ordered_json doc;
  doc["application_name"] = application_name;
  doc["incoming_protocol"] = incoming.manifest();
  doc["outgoing_protocol"] = outgoing.manifest();
  return doc.dump();
}

// ============================================================================
// PendingHandshake
// ============================================================================

PendingHandshake::PendingHandshake(sockpp::tcp_socket&& sock)
    : reader_(new StreamReader(std::move(sock))), started_(std::chrono::steady_clock::now()) {
  reader_->socket().set_non_blocking(true);
}

bool PendingHandshake::timed_out(int timeout_ms) const {
  if (timeout_ms <= 0) {
    return false;
  }
  auto elapsed = std::chrono::steady_clock::now() - started_;
  return elapsed > std::chrono::milliseconds(timeout_ms);
}

PendingHandshake::Status PendingHandshake::on_readable(const std::string& manifest_document) {
  if (writing()) {
    return flush();
  }

  auto filled = reader_->fill();
  if (!filled) {
    if (filled.get_error() == ErrorCode::kBufferFull) {
      return respond(HandshakeVerdict::kRequestTooLarge, manifest_document);
    }
    PWSS_LOG_DEBUG("Handshake aborted by peer: " + std::string(error_string(filled.get_error())));
    return Status::kRejected;
  }

  auto& buffer = reader_->buffer();
  std::string data(buffer.size(), '\0');
  buffer.peek(reinterpret_cast<uint8_t*>(&data[0]), data.size());

  size_t end = find_request_end(data);
  if (end == 0) {
    if (buffer.full()) {
      return respond(HandshakeVerdict::kRequestTooLarge, manifest_document);
    }
    return Status::kPending;
  }

  buffer.advance(end);
  if (!parse_request(std::string_view(data).substr(0, end), request_)) {
    return respond(HandshakeVerdict::kBadHttpVersion, manifest_document);
  }
  PWSS_LOG_DEBUG("Got [" + request_.method + "] request to [" + request_.uri + "] with version [" +
                 request_.version + "]");
  return respond(validate_request(request_), manifest_document);
}

PendingHandshake::Status PendingHandshake::respond(HandshakeVerdict verdict, const std::string& manifest_document) {
  verdict_ = verdict;
  outbox_ = build_response(verdict, request_, manifest_document);
  out_pos_ = 0;
  return flush();
}

PendingHandshake::Status PendingHandshake::on_writable() {
  if (!writing()) {
    return Status::kPending;
  }
  return flush();
}

PendingHandshake::Status PendingHandshake::flush() {
  auto& sock = reader_->socket();
  while (out_pos_ < outbox_.size()) {
    ssize_t n = sock.write(outbox_.data() + out_pos_, outbox_.size() - out_pos_);
    if (n > 0) {
      out_pos_ += static_cast<size_t>(n);
      continue;
    }
    int err = errno;
    if (n < 0 && err == EINTR) {
      continue;
    }
    if (n < 0 && (err == EAGAIN || err == EWOULDBLOCK)) {
      return Status::kPending;
    }
    PWSS_LOG_WARN("Failed to write handshake response");
    outbox_.clear();
    out_pos_ = 0;
    return Status::kRejected;
  }
  outbox_.clear();
  out_pos_ = 0;

  switch (verdict_) {
    case HandshakeVerdict::kUpgrade:
      sock.set_non_blocking(false);
      PWSS_LOG_DEBUG("Upgraded connection to [" + request_.uri + "]");
      return Status::kUpgraded;
    case HandshakeVerdict::kManifest:
      PWSS_LOG_DEBUG("Served manifest");
      return Status::kManifestServed;
    default:
      PWSS_LOG_WARN(std::string("Handshake rejected: ") + verdict_name(verdict_));
      return Status::kRejected;
  }
}

}  // namespace pwss
