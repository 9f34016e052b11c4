#include "pwss/protocol.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <type_traits>

namespace pwss {

namespace {

// True when v converts to To without leaving To's range.
template <typename To, typename From>
bool fits(From v) {
  if constexpr (std::is_floating_point<To>::value) {
    if constexpr (std::is_floating_point<From>::value) {
      return !std::isfinite(v) || (v >= -static_cast<From>(std::numeric_limits<To>::max()) &&
                                   v <= static_cast<From>(std::numeric_limits<To>::max()));
    } else {
      return true;
    }
  } else if constexpr (std::is_floating_point<From>::value) {
    // The truncated value must land in [lowest, max]; NaN fails both tests.
    From t = std::trunc(v);
    return t >= static_cast<From>(std::numeric_limits<To>::lowest()) &&
           t < static_cast<From>(std::numeric_limits<To>::max()) + 1;
  } else if constexpr (std::is_signed<From>::value) {
    if (v < 0) {
      return std::is_signed<To>::value && static_cast<int64_t>(v) >= static_cast<int64_t>(std::numeric_limits<To>::min());
    }
    return static_cast<uint64_t>(v) <= static_cast<uint64_t>(std::numeric_limits<To>::max());
  } else {
    return static_cast<uint64_t>(v) <= static_cast<uint64_t>(std::numeric_limits<To>::max());
  }
}

template <typename To, typename From>
bool narrow_to(From v, Value& out) {
  if (!fits<To>(v)) {
    return false;
  }
  out.emplace<To>(static_cast<To>(v));
  return true;
}

template <typename From>
bool narrow(FieldType type, From v, Value& out) {
  switch (type) {
    case FieldType::kU8:
      return narrow_to<uint8_t>(v, out);
    case FieldType::kBool:
      out.emplace<bool>(v != From{});
      return true;
    case FieldType::kU16:
      return narrow_to<uint16_t>(v, out);
    case FieldType::kU32:
      return narrow_to<uint32_t>(v, out);
    case FieldType::kU64:
      return narrow_to<uint64_t>(v, out);
    case FieldType::kI32:
      return narrow_to<int32_t>(v, out);
    case FieldType::kF32:
      return narrow_to<float>(v, out);
    case FieldType::kString:
      return false;
  }
  return false;
}

// Converts one make() argument to the declared kind. Strings only match String.
bool coerce(FieldType type, const Argument& in, Value& out) {
  if (const Value* value = std::get_if<Value>(&in)) {
    if (field_type_of(*value) == type) {
      out = *value;
      return true;
    }
    if (type == FieldType::kString || field_type_of(*value) == FieldType::kString) {
      return false;
    }
    return std::visit(
        [&](const auto& v) -> bool {
          using T = typename std::decay<decltype(v)>::type;
          if constexpr (std::is_arithmetic<T>::value) {
            return narrow(type, v, out);
          } else {
            return false;
          }
        },
        *value);
  }
  if (type == FieldType::kString) {
    return false;
  }
  if (const int64_t* v = std::get_if<int64_t>(&in)) {
    return narrow(type, *v, out);
  }
  if (const uint64_t* v = std::get_if<uint64_t>(&in)) {
    return narrow(type, *v, out);
  }
  return narrow(type, std::get<double>(in), out);
}

}  // namespace

// ============================================================================
// Builder
// ============================================================================

Protocol::Builder& Protocol::Builder::variant(std::string name, std::initializer_list<FieldType> args) {
  return variant(std::move(name), std::vector<FieldType>(args));
}

Protocol::Builder& Protocol::Builder::variant(std::string name, std::vector<FieldType> args) {
  if (variants_.size() >= kMaxVariants) {
    PWSS_THROW(std::length_error("protocol " + name_ + ": more than 256 variants"));
  }
  for (const auto& v : variants_) {
    if (v.name == name) {
      PWSS_THROW(std::invalid_argument("protocol " + name_ + ": duplicate variant " + name));
    }
  }
  Variant v;
  v.name = std::move(name);
  v.opcode = static_cast<uint8_t>(variants_.size());
  v.args = std::move(args);
  variants_.push_back(std::move(v));
  return *this;
}

Protocol::Ptr Protocol::Builder::build() const {
  return Ptr(new Protocol(name_, variants_));
}

// ============================================================================
// Protocol
// ============================================================================

Protocol::Protocol(std::string name, std::vector<Variant> variants)
    : name_(std::move(name)), variants_(std::move(variants)) {
  nlohmann::ordered_json operations = nlohmann::ordered_json::array();
  for (const auto& v : variants_) {
    nlohmann::ordered_json args = nlohmann::ordered_json::array();
    for (auto type : v.args) {
      args.push_back(field_type_name(type));
    }
    nlohmann::ordered_json op;
    op["name"] = v.name;
    op["opcode"] = v.opcode;
    op["args"] = std::move(args);
    operations.push_back(std::move(op));
  }
  manifest_["protocol"] = name_;
  manifest_["operations"] = std::move(operations);
  manifest_text_ = manifest_.dump();
}

const Variant* Protocol::find(uint8_t opcode) const {
  if (opcode >= variants_.size()) {
    return nullptr;
  }
  return &variants_[opcode];
}

const Variant* Protocol::find(std::string_view name) const {
  for (const auto& v : variants_) {
    if (v.name == name) {
      return &v;
    }
  }
  return nullptr;
}

Message Protocol::make_message(std::string_view name, const std::vector<Value>& values) const {
  std::vector<Argument> args;
  args.reserve(values.size());
  for (const auto& v : values) {
    args.push_back(to_argument(v));
  }
  return make_message(name, std::move(args));
}

Message Protocol::make_message(std::string_view name, std::vector<Argument> values) const {
  const Variant* variant = find(name);
  if (variant == nullptr) {
    PWSS_THROW(std::invalid_argument("protocol " + name_ + ": unknown variant " + std::string(name)));
  }
  if (values.size() != variant->args.size()) {
    PWSS_THROW(std::invalid_argument("protocol " + name_ + ": " + variant->name + " takes " +
                                     std::to_string(variant->args.size()) + " arguments"));
  }
  std::vector<Value> coerced(values.size());
  for (size_t i = 0; i < values.size(); ++i) {
    if (!coerce(variant->args[i], values[i], coerced[i])) {
      PWSS_THROW(std::invalid_argument("protocol " + name_ + ": " + variant->name + " argument " +
                                       std::to_string(i) + " does not fit " + field_type_name(variant->args[i])));
    }
  }
  return Message(variant->opcode, std::move(coerced));
}

expected<std::vector<uint8_t>, ErrorCode> Protocol::encode(const Message& message) const {
  using Result = expected<std::vector<uint8_t>, ErrorCode>;

  const Variant* variant = find(message.opcode());
  if (variant == nullptr || variant->args.size() != message.size()) {
    return Result::error(ErrorCode::kEncodeError);
  }

  ByteWriter writer;
  writer.put_u8(variant->opcode);
  for (size_t i = 0; i < message.size(); ++i) {
    const Value& arg = message.args()[i];
    if (field_type_of(arg) != variant->args[i] || !writer.put(arg)) {
      return Result::error(ErrorCode::kEncodeError);
    }
  }
  return Result::success(writer.release());
}

expected<Message, ErrorCode> Protocol::decode(const uint8_t* data, size_t size) const {
  using Result = expected<Message, ErrorCode>;

  ByteReader reader(data, size);
  auto opcode = reader.get_u8();
  if (!opcode) {
    return Result::error(ErrorCode::kDecodeError);
  }
  const Variant* variant = find(opcode.value());
  if (variant == nullptr) {
    return Result::error(ErrorCode::kDecodeError);
  }

  std::vector<Value> args;
  args.reserve(variant->args.size());
  for (auto type : variant->args) {
    auto value = reader.get(type);
    if (!value) {
      return Result::error(value.get_error());
    }
    args.push_back(value.value());
  }
  return Result::success(Message(variant->opcode, std::move(args)));
}

}  // namespace pwss
