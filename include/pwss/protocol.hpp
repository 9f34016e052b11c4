/**
 * @file protocol.hpp
 * @brief Tagged-union message schemas and their opcode-first binary codec.
 *
 * A Protocol is an ordered list of variants; a variant's opcode is its
 * declaration index. Encoding writes the opcode byte followed by each field
 * in declared order:
 *
 *   +--------+---------+---------+-----+
 *   | opcode | field 0 | field 1 | ... |
 *   +--------+---------+---------+-----+
 *
 * Usage:
 *   auto chat = pwss::Protocol::Builder("ChatIn")
 *                   .variant("Ping")
 *                   .variant("Say", {pwss::FieldType::kString})
 *                   .build();
 *   auto bytes = chat->encode(chat->make("Say", "hello"));
 */

#ifndef PWSS_PROTOCOL_HPP_
#define PWSS_PROTOCOL_HPP_

#include "codec.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <initializer_list>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace pwss {

struct Variant {
  std::string name;
  uint8_t opcode = 0;
  std::vector<FieldType> args;
};

// ============================================================================
// Message - one value of a Protocol
// ============================================================================

class Message {
 public:
  Message() = default;
  Message(uint8_t opcode, std::vector<Value> args) : opcode_(opcode), args_(std::move(args)) {}

  uint8_t opcode() const { return opcode_; }
  const std::vector<Value>& args() const { return args_; }
  size_t size() const { return args_.size(); }

  // Throws std::bad_variant_access / std::out_of_range on misuse.
  template <typename T>
  const T& get(size_t index) const {
    return std::get<T>(args_.at(index));
  }

  bool operator==(const Message& other) const { return opcode_ == other.opcode_ && args_ == other.args_; }
  bool operator!=(const Message& other) const { return !(*this == other); }

 private:
  uint8_t opcode_ = 0;
  std::vector<Value> args_;
};

// Argument of Protocol::make(): an exact Value, or a number kept at full width
// until Protocol::make_message() narrows it to the declared kind.
using Argument = std::variant<Value, int64_t, uint64_t, double>;

inline Argument to_argument(const char* s) {
  return Argument(std::in_place_type<Value>, Value(std::in_place_type<std::string>, s));
}
inline Argument to_argument(std::string_view s) {
  return Argument(std::in_place_type<Value>, Value(std::in_place_type<std::string>, s));
}
inline Argument to_argument(std::string s) {
  return Argument(std::in_place_type<Value>, Value(std::in_place_type<std::string>, std::move(s)));
}
inline Argument to_argument(Value v) { return Argument(std::in_place_type<Value>, std::move(v)); }

template <typename T, typename = typename std::enable_if<std::is_arithmetic<T>::value>::type>
Argument to_argument(T v) {
  if constexpr (std::is_same<T, bool>::value) {
    return Argument(std::in_place_type<Value>, Value(std::in_place_type<bool>, v));
  } else if constexpr (std::is_floating_point<T>::value) {
    return Argument(std::in_place_type<double>, static_cast<double>(v));
  } else if constexpr (std::is_signed<T>::value) {
    return Argument(std::in_place_type<int64_t>, static_cast<int64_t>(v));
  } else {
    return Argument(std::in_place_type<uint64_t>, static_cast<uint64_t>(v));
  }
}

// ============================================================================
// Protocol - immutable schema + codec
// ============================================================================

class Protocol {
 public:
  using Ptr = std::shared_ptr<const Protocol>;

  static constexpr size_t kMaxVariants = 256;

  class Builder {
   public:
    explicit Builder(std::string name) : name_(std::move(name)) {}

    // Throws std::length_error past kMaxVariants, std::invalid_argument on a duplicate name.
    Builder& variant(std::string name, std::initializer_list<FieldType> args = {});
    Builder& variant(std::string name, std::vector<FieldType> args);

    Ptr build() const;

   private:
    std::string name_;
    std::vector<Variant> variants_;
  };

  const std::string& name() const { return name_; }
  size_t size() const { return variants_.size(); }
  const std::vector<Variant>& variants() const { return variants_; }

  const Variant* find(uint8_t opcode) const;
  const Variant* find(std::string_view name) const;

  /**
   * @brief Builds a message of the named variant.
   *
   * Numeric arguments are converted to the declared field kind; strings must
   * be passed for String fields. Throws std::invalid_argument for an unknown
   * variant, a wrong argument count, a kind mismatch or a number outside the
   * range of its field.
   */
  template <typename... Args>
  Message make(std::string_view name, Args&&... args) const {
    std::vector<Argument> values;
    values.reserve(sizeof...(Args));
    (values.push_back(to_argument(std::forward<Args>(args))), ...);
    return make_message(name, std::move(values));
  }

  Message make_message(std::string_view name, std::vector<Argument> values) const;
  Message make_message(std::string_view name, const std::vector<Value>& values) const;

  // Fails with kEncodeError when the message does not match the schema.
  expected<std::vector<uint8_t>, ErrorCode> encode(const Message& message) const;

  // Unknown opcode or a short/invalid field yields kDecodeError. Trailing bytes are ignored.
  expected<Message, ErrorCode> decode(const uint8_t* data, size_t size) const;
  expected<Message, ErrorCode> decode(const std::vector<uint8_t>& bytes) const {
    return decode(bytes.data(), bytes.size());
  }

  const nlohmann::ordered_json& manifest() const { return manifest_; }
  const std::string& manifest_text() const { return manifest_text_; }

 private:
  Protocol(std::string name, std::vector<Variant> variants);

  std::string name_;
  std::vector<Variant> variants_;
  nlohmann::ordered_json manifest_;
  std::string manifest_text_;
};

}  // namespace pwss

#endif  // PWSS_PROTOCOL_HPP_
