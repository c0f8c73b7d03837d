#include "value_set.hpp"

#include "internal/observability/logging.hpp"

namespace tracereplay::dispatch {

using observability::StringField;
using observability::UintField;

bool ValueSet::Push(FieldHandle field, const record::FieldValue* value) {
  if (size_ == entries_.size()) {
    return false;
  }
  entries_[size_++] = FieldValueRef{field, value};
  return true;
}

ValueSet BuildValueSet(const metadata::Callsite& callsite, const std::vector<record::Field>& fields) {
  ValueSet    values;
  std::size_t truncated = 0;

  for (const auto& field : fields) {
    auto index = callsite.FieldIndex(field.name);
    if (!index) {
      continue;
    }
    if (!values.Push(FieldHandle{*index, callsite.field_names[*index]}, &field.value)) {
      ++truncated;
    }
  }

  if (truncated > 0) {
    TRACEREPLAY_LOG_WARN("field values beyond the supported maximum were dropped",
                         {StringField("callsite", callsite.name), UintField("max", kMaxFieldValues), UintField("dropped", truncated)});
  }
  return values;
}

} // namespace tracereplay::dispatch
