#ifndef PWSS_RING_BUFFER_HPP_
#define PWSS_RING_BUFFER_HPP_

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <sys/uio.h>  // readv

namespace pwss {

static constexpr size_t kCacheLine = 64;

// ============================================================================
// RingBuffer - Fixed-size circular buffer with zero-copy readv support
// ============================================================================

template <typename T, size_t Size>
class alignas(kCacheLine) RingBuffer {
 public:
  static constexpr size_t kCapacity = Size;

  RingBuffer() = default;

  // Write data to buffer
  bool push(const T* data, size_t len) {
    if (available() < len)
      return false;
    for (size_t i = 0; i < len; ++i) {
      buffer_[write_idx_] = data[i];
      write_idx_ = (write_idx_ + 1) % kCapacity;
    }
    count_ += len;
    return true;
  }

  // Read data from buffer without removing
  size_t peek(T* data, size_t max_len) const {
    size_t len = std::min(max_len, count_);
    size_t idx = read_idx_;
    for (size_t i = 0; i < len; ++i) {
      data[i] = buffer_[idx];
      idx = (idx + 1) % kCapacity;
    }
    return len;
  }

  // Copy out and remove
  size_t pop(T* data, size_t max_len) {
    size_t len = peek(data, max_len);
    advance(len);
    return len;
  }

  // Remove data from buffer
  void advance(size_t len) {
    if (len > count_)
      len = count_;
    read_idx_ = (read_idx_ + len) % kCapacity;
    count_ -= len;
  }

  size_t size() const { return count_; }
  size_t available() const { return kCapacity - count_; }
  bool empty() const { return count_ == 0; }
  bool full() const { return count_ == kCapacity; }

  void clear() {
    read_idx_ = 0;
    write_idx_ = 0;
    count_ = 0;
  }

  // Fill iovec for readv (zero-copy receive into write side)
  // Returns number of iovec entries filled (0, 1 or 2)
  size_t fill_iovec_write(struct iovec* iov, size_t max_iov) {
    size_t avail = available();
    if (avail == 0 || max_iov == 0) return 0;

    size_t contiguous = kCapacity - write_idx_;
    if (contiguous >= avail) {
      iov[0].iov_base = buffer_.data() + write_idx_;
      iov[0].iov_len = avail * sizeof(T);
      return 1;
    }

    if (max_iov < 2) {
      iov[0].iov_base = buffer_.data() + write_idx_;
      iov[0].iov_len = contiguous * sizeof(T);
      return 1;
    }

    // Free space wraps around: two chunks
    iov[0].iov_base = buffer_.data() + write_idx_;
    iov[0].iov_len = contiguous * sizeof(T);
    iov[1].iov_base = buffer_.data();
    iov[1].iov_len = (avail - contiguous) * sizeof(T);
    return 2;
  }

  // Commit bytes written by readv into the regions from fill_iovec_write()
  void commit_write(size_t len) {
    if (len > available())
      len = available();
    write_idx_ = (write_idx_ + len) % kCapacity;
    count_ += len;
  }

 private:
  alignas(kCacheLine) std::array<T, kCapacity> buffer_{};
  size_t read_idx_ = 0;
  size_t write_idx_ = 0;
  size_t count_ = 0;
};

}  // namespace pwss

#endif  // PWSS_RING_BUFFER_HPP_
