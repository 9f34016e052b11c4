#include "pwss/codec.hpp"

#include <catch2/catch.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace pwss;

// ============================================================================
// Field kinds
// ============================================================================

TEST_CASE("FieldType - manifest names", "[codec]") {
  REQUIRE(std::string(field_type_name(FieldType::kU8)) == "u8");
  REQUIRE(std::string(field_type_name(FieldType::kBool)) == "bool");
  REQUIRE(std::string(field_type_name(FieldType::kU16)) == "u16");
  REQUIRE(std::string(field_type_name(FieldType::kU32)) == "u32");
  REQUIRE(std::string(field_type_name(FieldType::kU64)) == "u64");
  REQUIRE(std::string(field_type_name(FieldType::kI32)) == "i32");
  REQUIRE(std::string(field_type_name(FieldType::kF32)) == "f32");
  REQUIRE(std::string(field_type_name(FieldType::kString)) == "String");
}

TEST_CASE("FieldType - value index maps to kind", "[codec]") {
  REQUIRE(field_type_of(Value(std::in_place_type<uint8_t>, 1)) == FieldType::kU8);
  REQUIRE(field_type_of(Value(std::in_place_type<bool>, true)) == FieldType::kBool);
  REQUIRE(field_type_of(Value(std::in_place_type<uint64_t>, 1)) == FieldType::kU64);
  REQUIRE(field_type_of(Value(std::in_place_type<float>, 1.0f)) == FieldType::kF32);
  REQUIRE(field_type_of(Value(std::in_place_type<std::string>, "x")) == FieldType::kString);
}

// ============================================================================
// ByteWriter
// ============================================================================

TEST_CASE("ByteWriter - fixed widths are exact", "[codec]") {
  const std::pair<Value, size_t> cases[] = {
      {Value(std::in_place_type<uint8_t>, 0xAB), 1},  {Value(std::in_place_type<bool>, true), 1},
      {Value(std::in_place_type<uint16_t>, 0xABCD), 2}, {Value(std::in_place_type<uint32_t>, 7), 4},
      {Value(std::in_place_type<uint64_t>, 7), 8},     {Value(std::in_place_type<int32_t>, -7), 4},
      {Value(std::in_place_type<float>, 1.5f), 4},
  };
  for (const auto& c : cases) {
    ByteWriter w;
    REQUIRE(w.put(c.first));
    REQUIRE(w.size() == c.second);
    REQUIRE(w.size() == fixed_width(field_type_of(c.first)));
  }
}

TEST_CASE("ByteWriter - integers are big-endian", "[codec]") {
  ByteWriter w;
  w.put_u16(0x0102);
  w.put_u32(0x03040506);
  w.put_u64(0x0708090A0B0C0D0EULL);
  const std::vector<uint8_t> expected = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08,
                                         0x09, 0x0A, 0x0B, 0x0C, 0x0D, 0x0E};
  REQUIRE(w.bytes() == expected);
}

TEST_CASE("ByteWriter - negative i32 is two's complement", "[codec]") {
  ByteWriter w;
  w.put_i32(-2);
  REQUIRE(w.bytes() == std::vector<uint8_t>{0xFF, 0xFF, 0xFF, 0xFE});
}

TEST_CASE("ByteWriter - f32 is IEEE-754 bits big-endian", "[codec]") {
  ByteWriter w;
  w.put_f32(1.0f);
  REQUIRE(w.bytes() == std::vector<uint8_t>{0x3F, 0x80, 0x00, 0x00});
}

TEST_CASE("ByteWriter - bool encodes as 0x00/0x01", "[codec]") {
  ByteWriter w;
  w.put_bool(true);
  w.put_bool(false);
  REQUIRE(w.bytes() == std::vector<uint8_t>{0x01, 0x00});
}

TEST_CASE("ByteWriter - string carries u16 length prefix", "[codec]") {
  ByteWriter w;
  REQUIRE(w.put_string("hi"));
  REQUIRE(w.bytes() == std::vector<uint8_t>{0x00, 0x02, 'h', 'i'});

  ByteWriter empty;
  REQUIRE(empty.put_string(""));
  REQUIRE(empty.bytes() == std::vector<uint8_t>{0x00, 0x00});
}

TEST_CASE("ByteWriter - string longer than 65535 bytes is refused", "[codec]") {
  ByteWriter w;
  REQUIRE(w.put_string(std::string(kMaxStringLength, 'a')));
  REQUIRE(w.size() == 2 + kMaxStringLength);

  ByteWriter too_long;
  REQUIRE_FALSE(too_long.put_string(std::string(kMaxStringLength + 1, 'a')));
  REQUIRE(too_long.size() == 0);
}

// ============================================================================
// ByteReader
// ============================================================================

TEST_CASE("ByteReader - primitives decode what was encoded", "[codec]") {
  ByteWriter w;
  w.put_u8(200);
  w.put_bool(true);
  w.put_u16(65535);
  w.put_u32(4000000000u);
  w.put_u64(std::numeric_limits<uint64_t>::max());
  w.put_i32(std::numeric_limits<int32_t>::min());
  w.put_f32(-3.25f);
  REQUIRE(w.put_string("caf\xC3\xA9"));

  ByteReader r(w.bytes());
  REQUIRE(r.get_u8().value() == 200);
  REQUIRE(r.get_bool().value() == true);
  REQUIRE(r.get_u16().value() == 65535);
  REQUIRE(r.get_u32().value() == 4000000000u);
  REQUIRE(r.get_u64().value() == std::numeric_limits<uint64_t>::max());
  REQUIRE(r.get_i32().value() == std::numeric_limits<int32_t>::min());
  REQUIRE(r.get_f32().value() == -3.25f);
  REQUIRE(r.get_string().value() == "caf\xC3\xA9");
  REQUIRE(r.remaining() == 0);
}

TEST_CASE("ByteReader - f32 NaN survives decode", "[codec]") {
  ByteWriter w;
  w.put_f32(std::numeric_limits<float>::quiet_NaN());
  ByteReader r(w.bytes());
  REQUIRE(std::isnan(r.get_f32().value()));
}

TEST_CASE("ByteReader - any non-0x01 bool byte is false", "[codec]") {
  const uint8_t bytes[] = {0x00, 0x02, 0xFF, 0x01};
  ByteReader r(bytes, sizeof(bytes));
  REQUIRE(r.get_bool().value() == false);
  REQUIRE(r.get_bool().value() == false);
  REQUIRE(r.get_bool().value() == false);
  REQUIRE(r.get_bool().value() == true);
}

TEST_CASE("ByteReader - short input is a decode error", "[codec]") {
  const uint8_t bytes[] = {0x01, 0x02, 0x03};
  ByteReader r(bytes, sizeof(bytes));
  auto v = r.get_u32();
  REQUIRE_FALSE(v.has_value());
  REQUIRE(v.get_error() == ErrorCode::kDecodeError);

  ByteReader empty(bytes, 0);
  REQUIRE(empty.get_u8().get_error() == ErrorCode::kDecodeError);
}

TEST_CASE("ByteReader - string shorter than its length prefix", "[codec]") {
  const uint8_t bytes[] = {0x00, 0x05, 'a', 'b'};
  ByteReader r(bytes, sizeof(bytes));
  auto s = r.get_string();
  REQUIRE_FALSE(s.has_value());
  REQUIRE(s.get_error() == ErrorCode::kDecodeError);
}

TEST_CASE("ByteReader - string with invalid UTF-8", "[codec]") {
  const uint8_t bytes[] = {0x00, 0x02, 0xC3, 0x28};
  ByteReader r(bytes, sizeof(bytes));
  auto s = r.get_string();
  REQUIRE_FALSE(s.has_value());
  REQUIRE(s.get_error() == ErrorCode::kDecodeError);
}

TEST_CASE("ByteReader - get(FieldType) yields the matching alternative", "[codec]") {
  ByteWriter w;
  w.put_u16(513);
  REQUIRE(w.put_string("ok"));
  ByteReader r(w.bytes());

  auto a = r.get(FieldType::kU16);
  REQUIRE(a.has_value());
  REQUIRE(field_type_of(a.value()) == FieldType::kU16);
  REQUIRE(std::get<uint16_t>(a.value()) == 513);

  auto b = r.get(FieldType::kString);
  REQUIRE(b.has_value());
  REQUIRE(std::get<std::string>(b.value()) == "ok");

  REQUIRE_FALSE(r.get(FieldType::kU8).has_value());
}
