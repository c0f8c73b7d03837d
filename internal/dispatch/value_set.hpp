#pragma once

#include <array>
#include <cstddef>
#include <string_view>
#include <vector>

#include "internal/metadata/callsite.hpp"
#include "internal/record/field_value.hpp"

namespace tracereplay::dispatch {

// Hard limit of the backend integration: a single span, event or record
// call carries at most this many field values. Extra values are dropped
// with a warning.
inline constexpr std::size_t kMaxFieldValues = 32;

// Position of a field in its callsite's declared field list.
struct FieldHandle {
  std::size_t      index{0};
  std::string_view name;
};

struct FieldValueRef {
  FieldHandle                field;
  const record::FieldValue*  value{nullptr};
};

/*
  Fixed-capacity list of field values for one backend call.

  Holds references only: the callsite and the recorded fields must outlive
  the set.
*/
class ValueSet {
 public:
  using const_iterator = const FieldValueRef*;

  // False if the set is full.
  bool Push(FieldHandle field, const record::FieldValue* value);

  std::size_t size() const {
    return size_;
  }

  bool empty() const {
    return size_ == 0;
  }

  const FieldValueRef& operator[](std::size_t i) const {
    return entries_[i];
  }

  const_iterator begin() const {
    return entries_.data();
  }

  const_iterator end() const {
    return entries_.data() + size_;
  }

 private:
  std::array<FieldValueRef, kMaxFieldValues> entries_{};
  std::size_t                                size_{0};
};

/*
  Match recorded fields against the callsite's declared fields.

  Names the callsite does not declare are skipped. Recorded order is kept.
  Anything past kMaxFieldValues is truncated and logged.
*/
ValueSet BuildValueSet(const metadata::Callsite& callsite, const std::vector<record::Field>& fields);

} // namespace tracereplay::dispatch
