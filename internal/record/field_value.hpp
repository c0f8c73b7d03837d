#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <google/protobuf/repeated_ptr_field.h>

#include "tracereplay/record/v1/record.pb.h"

namespace tracereplay::record {

using Int128  = __int128;
using Uint128 = unsigned __int128;

// Debug and Str both carry text but stay distinct kinds: Debug holds a
// value's debug rendering, Str a genuine string value.
struct DebugText {
  std::string text;
};

struct StrText {
  std::string text;
};

using FieldValue = std::variant<DebugText, double, int64_t, uint64_t, Int128, Uint128, bool, StrText>;

enum class ValueKind {
  kDebug,
  kF64,
  kI64,
  kU64,
  kI128,
  kU128,
  kBool,
  kStr,
};

struct Field {
  std::string name;
  FieldValue  value;
};

ValueKind        KindOf(const FieldValue& value);
std::string_view KindName(ValueKind kind);

// Renders the value for text backends. Debug and Str are returned verbatim.
std::string ToString(const FieldValue& value);

// Throws util::MalformedRecord on an empty oneof or an out-of-range 128-bit
// decimal.
FieldValue         FromProto(const v1::FieldValue& value);
std::vector<Field> FromProto(const google::protobuf::RepeatedPtrField<v1::Field>& fields);

// Same checks as FromProto without building the values. Throws
// util::MalformedRecord.
void ValidateFields(const google::protobuf::RepeatedPtrField<v1::Field>& fields);

bool        ParseInt128(std::string_view text, Int128* out);
bool        ParseUint128(std::string_view text, Uint128* out);
std::string FormatInt128(Int128 value);
std::string FormatUint128(Uint128 value);

} // namespace tracereplay::record
