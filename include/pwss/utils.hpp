#ifndef PWSS_UTILS_HPP_
#define PWSS_UTILS_HPP_

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace pwss {

// ============================================================================
// Base64 encoding (RFC 4648, padded)
// ============================================================================

class Base64 {
 public:
  static std::string encode(const uint8_t* data, size_t size) {
    static constexpr const char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string result;
    result.reserve((size + 2) / 3 * 4);

    for (size_t i = 0; i < size; i += 3) {
      uint32_t b = (static_cast<uint32_t>(data[i]) << 16);
      if (i + 1 < size) b |= (static_cast<uint32_t>(data[i + 1]) << 8);
      if (i + 2 < size) b |= static_cast<uint32_t>(data[i + 2]);

      result.push_back(kAlphabet[(b >> 18) & 0x3F]);
      result.push_back(kAlphabet[(b >> 12) & 0x3F]);
      result.push_back(i + 1 < size ? kAlphabet[(b >> 6) & 0x3F] : '=');
      result.push_back(i + 2 < size ? kAlphabet[b & 0x3F] : '=');
    }
    return result;
  }
};

// ============================================================================
// SHA-1 hashing (for WebSocket accept key generation)
// ============================================================================

class SHA1 {
 public:
  static std::array<uint8_t, 20> compute(const uint8_t* data, size_t size) {
    SHA1 sha1;
    sha1.update(data, size);
    return sha1.finalize();
  }

  void update(const uint8_t* data, size_t size) {
    for (size_t i = 0; i < size; ++i) {
      buffer_[buf_pos_++] = data[i];
      ++total_bytes_;
      if (buf_pos_ == 64) {
        process_block(buffer_.data());
        buf_pos_ = 0;
      }
    }
  }

  std::array<uint8_t, 20> finalize() {
    buffer_[buf_pos_++] = 0x80;
    if (buf_pos_ > 56) {
      while (buf_pos_ < 64) buffer_[buf_pos_++] = 0;
      process_block(buffer_.data());
      buf_pos_ = 0;
    }
    while (buf_pos_ < 56) buffer_[buf_pos_++] = 0;

    uint64_t total_bits = total_bytes_ * 8;
    for (int i = 7; i >= 0; --i) {
      buffer_[56 + (7 - i)] = static_cast<uint8_t>((total_bits >> (i * 8)) & 0xFF);
    }
    process_block(buffer_.data());

    std::array<uint8_t, 20> result;
    for (int i = 0; i < 5; ++i) {
      result[i * 4] = static_cast<uint8_t>((h_[i] >> 24) & 0xFF);
      result[i * 4 + 1] = static_cast<uint8_t>((h_[i] >> 16) & 0xFF);
      result[i * 4 + 2] = static_cast<uint8_t>((h_[i] >> 8) & 0xFF);
      result[i * 4 + 3] = static_cast<uint8_t>(h_[i] & 0xFF);
    }
    return result;
  }

 private:
  std::array<uint32_t, 5> h_ = {0x67452301, 0xEFCDAB89, 0x98BADCFE, 0x10325476, 0xC3D2E1F0};
  std::array<uint8_t, 64> buffer_{};
  uint32_t buf_pos_ = 0;
  uint64_t total_bytes_ = 0;

  static uint32_t rol(uint32_t x, int n) { return (x << n) | (x >> (32 - n)); }

  void process_block(const uint8_t* block) {
    std::array<uint32_t, 80> w;
    for (int i = 0; i < 16; ++i) {
      w[i] = (static_cast<uint32_t>(block[i * 4]) << 24) |
             (static_cast<uint32_t>(block[i * 4 + 1]) << 16) |
             (static_cast<uint32_t>(block[i * 4 + 2]) << 8) |
             static_cast<uint32_t>(block[i * 4 + 3]);
    }
    for (int i = 16; i < 80; ++i) {
      w[i] = rol(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
    }

    uint32_t a = h_[0], b = h_[1], c = h_[2], d = h_[3], e = h_[4];
    for (int i = 0; i < 80; ++i) {
      uint32_t f = 0, k = 0;
      if (i < 20) {
        f = (b & c) | ((~b) & d);
        k = 0x5A827999;
      } else if (i < 40) {
        f = b ^ c ^ d;
        k = 0x6ED9EBA1;
      } else if (i < 60) {
        f = (b & c) | (b & d) | (c & d);
        k = 0x8F1BBCDC;
      } else {
        f = b ^ c ^ d;
        k = 0xCA62C1D6;
      }
      uint32_t temp = rol(a, 5) + f + e + k + w[i];
      e = d;
      d = c;
      c = rol(b, 30);
      b = a;
      a = temp;
    }

    h_[0] += a;
    h_[1] += b;
    h_[2] += c;
    h_[3] += d;
    h_[4] += e;
  }
};

// ============================================================================
// String helpers (HTTP header handling)
// ============================================================================

inline char ascii_lower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline std::string to_lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = ascii_lower(c);
  return out;
}

inline std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r' || s.front() == '\n')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
    s.remove_suffix(1);
  }
  return s;
}

inline bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (ascii_lower(a[i]) != ascii_lower(b[i])) return false;
  }
  return true;
}

// Case-insensitive substring search ("keep-alive, Upgrade" contains "upgrade").
inline bool icontains(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) return true;
  if (haystack.size() < needle.size()) return false;
  for (size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
    if (iequals(haystack.substr(i, needle.size()), needle)) return true;
  }
  return false;
}

// ============================================================================
// UTF-8 validation
// ============================================================================

/*
 * Well-formed UTF-8 byte sequences (Unicode Table 3-7):
 *
 *  Code Points        | First  | Second | Third  | Fourth
 *  U+0000..U+007F     | 00..7F |        |        |
 *  U+0080..U+07FF     | C2..DF | 80..BF |        |
 *  U+0800..U+0FFF     | E0     | A0..BF | 80..BF |
 *  U+1000..U+CFFF     | E1..EC | 80..BF | 80..BF |
 *  U+D000..U+D7FF     | ED     | 80..9F | 80..BF |
 *  U+E000..U+FFFF     | EE..EF | 80..BF | 80..BF |
 *  U+10000..U+3FFFF   | F0     | 90..BF | 80..BF | 80..BF
 *  U+40000..U+FFFFF   | F1..F3 | 80..BF | 80..BF | 80..BF
 *  U+100000..U+10FFFF | F4     | 80..8F | 80..BF | 80..BF
 */
inline bool is_valid_utf8(const uint8_t* data, size_t len) {
  size_t i = 0;
  while (i < len) {
    uint8_t c = data[i];
    if (c <= 0x7F) {
      ++i;
      continue;
    }

    size_t extra = 0;
    uint8_t lo = 0x80, hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
      extra = 1;
    } else if (c == 0xE0) {
      extra = 2;
      lo = 0xA0;
    } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
      extra = 2;
    } else if (c == 0xED) {
      extra = 2;
      hi = 0x9F;
    } else if (c == 0xF0) {
      extra = 3;
      lo = 0x90;
    } else if (c >= 0xF1 && c <= 0xF3) {
      extra = 3;
    } else if (c == 0xF4) {
      extra = 3;
      hi = 0x8F;
    } else {
      return false;
    }

    if (len - i <= extra) return false;
    // Only the second byte has a narrowed range.
    if (data[i + 1] < lo || data[i + 1] > hi) return false;
    for (size_t k = 2; k <= extra; ++k) {
      if (data[i + k] < 0x80 || data[i + k] > 0xBF) return false;
    }
    i += extra + 1;
  }
  return true;
}

}  // namespace pwss

#endif  // PWSS_UTILS_HPP_
