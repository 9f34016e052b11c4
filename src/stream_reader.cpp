#include "pwss/stream_reader.hpp"

#include <cerrno>

#include <sys/uio.h>

namespace pwss {

ErrorCode StreamReader::map_errno(int err) {
  // SO_RCVTIMEO expiry surfaces as EAGAIN on a blocking socket.
  if (err == EAGAIN || err == EWOULDBLOCK) {
    return ErrorCode::kTimeout;
  }
  return ErrorCode::kSocketError;
}

expected<size_t, ErrorCode> StreamReader::fill() {
  struct iovec iov[2];
  size_t iov_count = buffer_.fill_iovec_write(iov, 2);
  if (iov_count == 0) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kBufferFull);
  }

  for (;;) {
    ssize_t n = ::readv(socket_.handle(), iov, static_cast<int>(iov_count));
    if (n > 0) {
      buffer_.commit_write(static_cast<size_t>(n));
      return expected<size_t, ErrorCode>::success(static_cast<size_t>(n));
    }
    if (n == 0) {
      return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);
    }
    int err = errno;
    if (err == EINTR) {
      continue;
    }
    if (err == EAGAIN || err == EWOULDBLOCK) {
      return expected<size_t, ErrorCode>::success(0);
    }
    return expected<size_t, ErrorCode>::error(ErrorCode::kSocketError);
  }
}

expected<void, ErrorCode> StreamReader::read_exact(uint8_t* out, size_t len) {
  size_t got = buffer_.pop(out, len);

  // Large payloads bypass the ring buffer.
  while (got < len) {
    if (len - got >= kBufferSize) {
      ssize_t n = socket_.read(out + got, len - got);
      if (n > 0) {
        got += static_cast<size_t>(n);
        continue;
      }
      if (n == 0) {
        return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
      }
      int err = errno;
      if (err == EINTR) {
        continue;
      }
      return expected<void, ErrorCode>::error(map_errno(err));
    }

    struct iovec iov[2];
    size_t iov_count = buffer_.fill_iovec_write(iov, 2);
    ssize_t n = ::readv(socket_.handle(), iov, static_cast<int>(iov_count));
    if (n > 0) {
      buffer_.commit_write(static_cast<size_t>(n));
      got += buffer_.pop(out + got, len - got);
      continue;
    }
    if (n == 0) {
      return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
    }
    int err = errno;
    if (err == EINTR) {
      continue;
    }
    return expected<void, ErrorCode>::error(map_errno(err));
  }
  return expected<void, ErrorCode>::success();
}

}  // namespace pwss
