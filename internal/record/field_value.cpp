#include "field_value.hpp"

#include <charconv>
#include <limits>
#include <system_error>
#include <type_traits>

#include "internal/util/errors.hpp"

namespace tracereplay::record {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string FormatDouble(double value) {
  char buffer[64];
  auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
  if (ec != std::errc{}) {
    return std::to_string(value);
  }
  return std::string(buffer, end);
}

} // namespace

ValueKind KindOf(const FieldValue& value) {
  return static_cast<ValueKind>(value.index());
}

std::string_view KindName(ValueKind kind) {
  switch (kind) {
    case ValueKind::kDebug:
      return "debug";
    case ValueKind::kF64:
      return "f64";
    case ValueKind::kI64:
      return "i64";
    case ValueKind::kU64:
      return "u64";
    case ValueKind::kI128:
      return "i128";
    case ValueKind::kU128:
      return "u128";
    case ValueKind::kBool:
      return "bool";
    case ValueKind::kStr:
      return "str";
  }
  return "unknown";
}

std::string ToString(const FieldValue& value) {
  return std::visit(Overloaded{
                        [](const DebugText& v) { return v.text; },
                        [](double v) { return FormatDouble(v); },
                        [](int64_t v) { return std::to_string(v); },
                        [](uint64_t v) { return std::to_string(v); },
                        [](Int128 v) { return FormatInt128(v); },
                        [](Uint128 v) { return FormatUint128(v); },
                        [](bool v) { return std::string(v ? "true" : "false"); },
                        [](const StrText& v) { return v.text; },
                    },
                    value);
}

bool ParseUint128(std::string_view text, Uint128* out) {
  if (text.empty()) {
    return false;
  }

  constexpr Uint128 kMax = std::numeric_limits<Uint128>::max();
  Uint128           acc  = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
    const auto digit = static_cast<unsigned>(c - '0');
    if (acc > (kMax - digit) / 10) {
      return false;
    }
    acc = acc * 10 + digit;
  }
  *out = acc;
  return true;
}

bool ParseInt128(std::string_view text, Int128* out) {
  bool negative = false;
  if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  Uint128 magnitude = 0;
  if (!ParseUint128(text, &magnitude)) {
    return false;
  }

  // |min| is one larger than max.
  constexpr Uint128 kMaxPositive = static_cast<Uint128>(std::numeric_limits<Int128>::max());
  if (negative) {
    if (magnitude > kMaxPositive + 1) {
      return false;
    }
    *out = magnitude == kMaxPositive + 1 ? std::numeric_limits<Int128>::min() : -static_cast<Int128>(magnitude);
    return true;
  }

  if (magnitude > kMaxPositive) {
    return false;
  }
  *out = static_cast<Int128>(magnitude);
  return true;
}

std::string FormatUint128(Uint128 value) {
  if (value == 0) {
    return "0";
  }
  std::string digits;
  while (value > 0) {
    digits.insert(digits.begin(), static_cast<char>('0' + static_cast<int>(value % 10)));
    value /= 10;
  }
  return digits;
}

std::string FormatInt128(Int128 value) {
  if (value >= 0) {
    return FormatUint128(static_cast<Uint128>(value));
  }
  // Negate in the unsigned domain so min() does not overflow.
  return "-" + FormatUint128(Uint128{0} - static_cast<Uint128>(value));
}

FieldValue FromProto(const v1::FieldValue& value) {
  switch (value.value_case()) {
    case v1::FieldValue::kDebug:
      return DebugText{value.debug()};
    case v1::FieldValue::kF64:
      return value.f64();
    case v1::FieldValue::kI64:
      return static_cast<int64_t>(value.i64());
    case v1::FieldValue::kU64:
      return static_cast<uint64_t>(value.u64());
    case v1::FieldValue::kI128: {
      Int128 parsed = 0;
      if (!ParseInt128(value.i128(), &parsed)) {
        throw util::MalformedRecord("invalid i128 value '" + value.i128() + "'");
      }
      return parsed;
    }
    case v1::FieldValue::kU128: {
      Uint128 parsed = 0;
      if (!ParseUint128(value.u128(), &parsed)) {
        throw util::MalformedRecord("invalid u128 value '" + value.u128() + "'");
      }
      return parsed;
    }
    case v1::FieldValue::kBoolValue:
      return value.bool_value();
    case v1::FieldValue::kStr:
      return StrText{value.str()};
    case v1::FieldValue::VALUE_NOT_SET:
      break;
  }
  throw util::MalformedRecord("field value has no kind");
}

std::vector<Field> FromProto(const google::protobuf::RepeatedPtrField<v1::Field>& fields) {
  std::vector<Field> out;
  out.reserve(fields.size());
  for (const auto& field : fields) {
    if (!field.has_value()) {
      throw util::MalformedRecord("field '" + field.name() + "' has no value");
    }
    out.push_back(Field{field.name(), FromProto(field.value())});
  }
  return out;
}

void ValidateFields(const google::protobuf::RepeatedPtrField<v1::Field>& fields) {
  for (const auto& field : fields) {
    if (!field.has_value()) {
      throw util::MalformedRecord("field '" + field.name() + "' has no value");
    }
    const auto& value = field.value();
    switch (value.value_case()) {
      case v1::FieldValue::kI128: {
        Int128 unused = 0;
        if (!ParseInt128(value.i128(), &unused)) {
          throw util::MalformedRecord("invalid i128 value '" + value.i128() + "'");
        }
        break;
      }
      case v1::FieldValue::kU128: {
        Uint128 unused = 0;
        if (!ParseUint128(value.u128(), &unused)) {
          throw util::MalformedRecord("invalid u128 value '" + value.u128() + "'");
        }
        break;
      }
      case v1::FieldValue::VALUE_NOT_SET:
        throw util::MalformedRecord("field value has no kind");
      default:
        break;
    }
  }
}

} // namespace tracereplay::record
