/**
 * @file codec.hpp
 * @brief Binary codec primitives: field kinds, values, byte writer/reader.
 *
 * Every multi-byte integer and float is encoded big-endian (network order).
 * Strings carry a u16 big-endian length prefix followed by UTF-8 bytes.
 */

#ifndef PWSS_CODEC_HPP_
#define PWSS_CODEC_HPP_

#include "utils.hpp"
#include "vocabulary.hpp"

#include <cstdint>
#include <cstring>

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace pwss {

// ============================================================================
// Field kinds
// ============================================================================

// Order matches the alternatives of Value, so Value::index() maps onto it.
enum class FieldType : uint8_t {
  kU8 = 0,
  kBool = 1,
  kU16 = 2,
  kU32 = 3,
  kU64 = 4,
  kI32 = 5,
  kF32 = 6,
  kString = 7
};

using Value = std::variant<uint8_t, bool, uint16_t, uint32_t, uint64_t, int32_t, float, std::string>;

static_assert(std::variant_size<Value>::value == 8, "Value must have one alternative per FieldType");

// Names published in the manifest; clients look codecs up by these.
inline const char* field_type_name(FieldType type) {
  switch (type) {
    case FieldType::kU8:
      return "u8";
    case FieldType::kBool:
      return "bool";
    case FieldType::kU16:
      return "u16";
    case FieldType::kU32:
      return "u32";
    case FieldType::kU64:
      return "u64";
    case FieldType::kI32:
      return "i32";
    case FieldType::kF32:
      return "f32";
    case FieldType::kString:
      return "String";
  }
  return "";
}

inline FieldType field_type_of(const Value& value) {
  return static_cast<FieldType>(value.index());
}

// Encoded width in bytes, or 0 for variable-width kinds.
inline size_t fixed_width(FieldType type) {
  switch (type) {
    case FieldType::kU8:
    case FieldType::kBool:
      return 1;
    case FieldType::kU16:
      return 2;
    case FieldType::kU32:
    case FieldType::kI32:
    case FieldType::kF32:
      return 4;
    case FieldType::kU64:
      return 8;
    case FieldType::kString:
      return 0;
  }
  return 0;
}

static constexpr size_t kMaxStringLength = 0xFFFF;

// ============================================================================
// ByteWriter - appends big-endian primitives to a growable buffer
// ============================================================================

class ByteWriter {
 public:
  ByteWriter() = default;

  void put_u8(uint8_t v) { buf_.push_back(v); }
  void put_bool(bool v) { buf_.push_back(v ? 0x01 : 0x00); }
  void put_u16(uint16_t v) { put_be(v, 2); }
  void put_u32(uint32_t v) { put_be(v, 4); }
  void put_u64(uint64_t v) { put_be(v, 8); }
  void put_i32(int32_t v) { put_be(static_cast<uint32_t>(v), 4); }

  void put_f32(float v) {
    uint32_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    put_be(bits, 4);
  }

  // Fails when the string does not fit the u16 length prefix.
  [[nodiscard]] bool put_string(std::string_view v) {
    if (v.size() > kMaxStringLength) {
      return false;
    }
    put_be(static_cast<uint16_t>(v.size()), 2);
    buf_.insert(buf_.end(), v.begin(), v.end());
    return true;
  }

  [[nodiscard]] bool put(const Value& value) {
    switch (field_type_of(value)) {
      case FieldType::kU8:
        put_u8(std::get<uint8_t>(value));
        return true;
      case FieldType::kBool:
        put_bool(std::get<bool>(value));
        return true;
      case FieldType::kU16:
        put_u16(std::get<uint16_t>(value));
        return true;
      case FieldType::kU32:
        put_u32(std::get<uint32_t>(value));
        return true;
      case FieldType::kU64:
        put_u64(std::get<uint64_t>(value));
        return true;
      case FieldType::kI32:
        put_i32(std::get<int32_t>(value));
        return true;
      case FieldType::kF32:
        put_f32(std::get<float>(value));
        return true;
      case FieldType::kString:
        return put_string(std::get<std::string>(value));
    }
    return false;
  }

  size_t size() const { return buf_.size(); }
  const std::vector<uint8_t>& bytes() const { return buf_; }
  std::vector<uint8_t> release() { return std::move(buf_); }

 private:
  void put_be(uint64_t v, size_t width) {
    for (size_t i = width; i > 0; --i) {
      buf_.push_back(static_cast<uint8_t>((v >> ((i - 1) * 8)) & 0xFF));
    }
  }

  std::vector<uint8_t> buf_;
};

// ============================================================================
// ByteReader - cursor over a borrowed byte range
// ============================================================================

/**
 * @brief Reads big-endian primitives from a non-owning byte range.
 *
 * A failed read returns ErrorCode::kDecodeError; the cursor must not be used
 * after a failure.
 */
class ByteReader {
 public:
  ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

  explicit ByteReader(const std::vector<uint8_t>& bytes) : data_(bytes.data()), size_(bytes.size()) {}

  size_t remaining() const { return size_ - pos_; }
  size_t position() const { return pos_; }

  expected<uint8_t, ErrorCode> get_u8() {
    if (remaining() < 1) {
      return expected<uint8_t, ErrorCode>::error(ErrorCode::kDecodeError);
    }
    return expected<uint8_t, ErrorCode>::success(data_[pos_++]);
  }

  expected<bool, ErrorCode> get_bool() {
    auto b = get_u8();
    if (!b) {
      return expected<bool, ErrorCode>::error(b.get_error());
    }
    return expected<bool, ErrorCode>::success(b.value() == 0x01);
  }

  expected<uint16_t, ErrorCode> get_u16() { return get_be<uint16_t>(); }
  expected<uint32_t, ErrorCode> get_u32() { return get_be<uint32_t>(); }
  expected<uint64_t, ErrorCode> get_u64() { return get_be<uint64_t>(); }

  expected<int32_t, ErrorCode> get_i32() {
    auto v = get_be<uint32_t>();
    if (!v) {
      return expected<int32_t, ErrorCode>::error(v.get_error());
    }
    return expected<int32_t, ErrorCode>::success(static_cast<int32_t>(v.value()));
  }

  expected<float, ErrorCode> get_f32() {
    auto v = get_be<uint32_t>();
    if (!v) {
      return expected<float, ErrorCode>::error(v.get_error());
    }
    float f = 0.0f;
    uint32_t bits = v.value();
    std::memcpy(&f, &bits, sizeof(f));
    return expected<float, ErrorCode>::success(f);
  }

  expected<std::string, ErrorCode> get_string() {
    auto len = get_u16();
    if (!len) {
      return expected<std::string, ErrorCode>::error(len.get_error());
    }
    size_t n = len.value();
    if (remaining() < n || !is_valid_utf8(data_ + pos_, n)) {
      return expected<std::string, ErrorCode>::error(ErrorCode::kDecodeError);
    }
    std::string s(reinterpret_cast<const char*>(data_ + pos_), n);
    pos_ += n;
    return expected<std::string, ErrorCode>::success(std::move(s));
  }

  expected<Value, ErrorCode> get(FieldType type) {
    switch (type) {
      case FieldType::kU8:
        return wrap(get_u8());
      case FieldType::kBool:
        return wrap(get_bool());
      case FieldType::kU16:
        return wrap(get_u16());
      case FieldType::kU32:
        return wrap(get_u32());
      case FieldType::kU64:
        return wrap(get_u64());
      case FieldType::kI32:
        return wrap(get_i32());
      case FieldType::kF32:
        return wrap(get_f32());
      case FieldType::kString:
        return wrap(get_string());
    }
    return expected<Value, ErrorCode>::error(ErrorCode::kDecodeError);
  }

 private:
  template <typename T>
  expected<T, ErrorCode> get_be() {
    if (remaining() < sizeof(T)) {
      return expected<T, ErrorCode>::error(ErrorCode::kDecodeError);
    }
    uint64_t v = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
      v = (v << 8) | data_[pos_ + i];
    }
    pos_ += sizeof(T);
    return expected<T, ErrorCode>::success(static_cast<T>(v));
  }

  template <typename T>
  static expected<Value, ErrorCode> wrap(const expected<T, ErrorCode>& r) {
    if (!r) {
      return expected<Value, ErrorCode>::error(r.get_error());
    }
    return expected<Value, ErrorCode>::success(Value(std::in_place_type<T>, r.value()));
  }

  const uint8_t* data_;
  size_t size_;
  size_t pos_ = 0;
};

}  // namespace pwss

#endif  // PWSS_CODEC_HPP_
