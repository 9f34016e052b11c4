#include "pwss/vocabulary.hpp"

#include <catch2/catch.hpp>

#include <cstring>
#include <memory>
#include <string>

using namespace pwss;

// ============================================================================
// expected<V, E>
// ============================================================================

TEST_CASE("expected - success with value", "[vocabulary]") {
  auto result = expected<int, ErrorCode>::success(42);
  REQUIRE(result.has_value());
  REQUIRE(result.value() == 42);
}

TEST_CASE("expected - error", "[vocabulary]") {
  auto result = expected<int, ErrorCode>::error(ErrorCode::kDecodeError);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kDecodeError);
}

TEST_CASE("expected - bool conversion and value_or", "[vocabulary]") {
  auto ok = expected<int, ErrorCode>::success(10);
  auto err = expected<int, ErrorCode>::error(ErrorCode::kTimeout);
  REQUIRE(static_cast<bool>(ok));
  REQUIRE_FALSE(static_cast<bool>(err));
  REQUIRE(ok.value_or(99) == 10);
  REQUIRE(err.value_or(99) == 99);
}

TEST_CASE("expected - holds non-trivial values", "[vocabulary]") {
  auto original = expected<std::string, ErrorCode>::success(std::string(100, 'x'));
  auto copy = original;
  REQUIRE(copy.value().size() == 100);

  auto moved = static_cast<expected<std::string, ErrorCode>&&>(original);
  REQUIRE(moved.value().size() == 100);

  copy = expected<std::string, ErrorCode>::error(ErrorCode::kEncodeError);
  REQUIRE_FALSE(copy.has_value());
  REQUIRE(copy.get_error() == ErrorCode::kEncodeError);
}

TEST_CASE("expected<void> - success and error", "[vocabulary]") {
  REQUIRE(expected<void, ErrorCode>::success().has_value());
  auto result = expected<void, ErrorCode>::error(ErrorCode::kHandshakeFailed);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kHandshakeFailed);
}

TEST_CASE("error_string names every protocol error", "[vocabulary]") {
  const ErrorCode codes[] = {ErrorCode::kOk,
                             ErrorCode::kBufferFull,
                             ErrorCode::kHandshakeFailed,
                             ErrorCode::kFrameParseError,
                             ErrorCode::kUnmaskedFrame,
                             ErrorCode::kUnsupportedOpcode,
                             ErrorCode::kPayloadTooLarge,
                             ErrorCode::kDecodeError,
                             ErrorCode::kEncodeError,
                             ErrorCode::kConnectionClosed,
                             ErrorCode::kInvalidState,
                             ErrorCode::kSocketError,
                             ErrorCode::kTimeout,
                             ErrorCode::kMaxConnectionsExceeded,
                             ErrorCode::kInternalError};
  for (auto code : codes) {
    REQUIRE(error_string(code) != nullptr);
    REQUIRE(std::strlen(error_string(code)) > 0);
  }
  REQUIRE(std::string(error_string(ErrorCode::kUnmaskedFrame)) !=
          std::string(error_string(ErrorCode::kUnsupportedOpcode)));
}

// ============================================================================
// optional<T>
// ============================================================================

TEST_CASE("optional - empty", "[vocabulary]") {
  optional<int> opt;
  REQUIRE(!opt.has_value());
  REQUIRE_FALSE(static_cast<bool>(opt));
  REQUIRE(opt.value_or(99) == 99);
}

TEST_CASE("optional - with value", "[vocabulary]") {
  optional<int> opt(42);
  REQUIRE(opt.has_value());
  REQUIRE(opt.value() == 42);
  opt.reset();
  REQUIRE(!opt.has_value());
}

TEST_CASE("optional - copy and move of non-trivial value", "[vocabulary]") {
  optional<std::string> a(std::string("hello"));
  optional<std::string> b = a;
  REQUIRE(b.value() == "hello");
  optional<std::string> c = static_cast<optional<std::string>&&>(a);
  REQUIRE(c.value() == "hello");
}

// ============================================================================
// FixedVector<T, N>
// ============================================================================

TEST_CASE("FixedVector - initial empty", "[vocabulary]") {
  FixedVector<int, 8> v;
  REQUIRE(v.empty());
  REQUIRE(v.size() == 0);
  REQUIRE(v.capacity() == 8);
}

TEST_CASE("FixedVector - push_back until full", "[vocabulary]") {
  FixedVector<int, 2> v;
  REQUIRE(v.push_back(1));
  REQUIRE(v.push_back(2));
  REQUIRE(v.full());
  REQUIRE(!v.push_back(3));
  REQUIRE(v[0] == 1);
  REQUIRE(v.back() == 2);
}

TEST_CASE("FixedVector - pop_back and clear", "[vocabulary]") {
  FixedVector<int, 4> v;
  REQUIRE(!v.pop_back());
  v.push_back(1);
  v.push_back(2);
  REQUIRE(v.pop_back());
  REQUIRE(v.size() == 1);
  v.clear();
  REQUIRE(v.empty());
}

TEST_CASE("FixedVector - erase_unordered swaps in the last element", "[vocabulary]") {
  FixedVector<int, 4> v;
  v.push_back(10);
  v.push_back(20);
  v.push_back(30);
  v.erase_unordered(0);
  REQUIRE(v.size() == 2);
  REQUIRE(v[0] == 30);
  REQUIRE(v[1] == 20);

  v.erase_unordered(1);
  REQUIRE(v.size() == 1);
  REQUIRE(v[0] == 30);

  v.erase_unordered(5);  // out of range is a no-op
  REQUIRE(v.size() == 1);
}

TEST_CASE("FixedVector - owns move-only elements", "[vocabulary]") {
  auto tracker = std::make_shared<int>(0);
  {
    FixedVector<std::unique_ptr<std::shared_ptr<int>>, 4> v;
    v.push_back(std::unique_ptr<std::shared_ptr<int>>(new std::shared_ptr<int>(tracker)));
    v.push_back(std::unique_ptr<std::shared_ptr<int>>(new std::shared_ptr<int>(tracker)));
    REQUIRE(tracker.use_count() == 3);
    v.erase_unordered(0);
    REQUIRE(tracker.use_count() == 2);
  }
  REQUIRE(tracker.use_count() == 1);
}

TEST_CASE("FixedVector - iterator", "[vocabulary]") {
  FixedVector<int, 4> v;
  v.push_back(1);
  v.push_back(2);
  v.push_back(3);
  int sum = 0;
  for (int x : v) {
    sum += x;
  }
  REQUIRE(sum == 6);
}
