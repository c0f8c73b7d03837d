#pragma once

#include <string_view>
#include <variant>
#include <vector>

#include "internal/dispatch/dispatch.hpp"
#include "internal/metadata/callsite_registry.hpp"
#include "internal/record/field_value.hpp"
#include "internal/span/span_id_map.hpp"
#include "internal/util/time.hpp"

namespace tracereplay::replay {

using span::RecordedSpanId;

// Parent as written in the recording; `span` is only set for kExplicit.
struct RecordedParent {
  dispatch::ParentKind kind{dispatch::ParentKind::kCurrent};
  RecordedSpanId       span{0};
};

/*
  Records after coordinator-side preparation: callsites are interned and
  field values decoded, span ids are still the recorded ones.
*/
struct RegisterCallsiteTrace {
  metadata::CallsiteHandle callsite;
};

struct EventTrace {
  metadata::CallsiteHandle   callsite;
  std::vector<record::Field> fields;
  RecordedParent             parent;
};

struct NewSpanTrace {
  RecordedSpanId             id{0};
  metadata::CallsiteHandle   callsite;
  std::vector<record::Field> fields;
  RecordedParent             parent;
};

struct EnterTrace {
  RecordedSpanId id{0};
};

struct ExitTrace {
  RecordedSpanId id{0};
};

struct CloseTrace {
  RecordedSpanId id{0};
};

struct RecordTrace {
  RecordedSpanId             id{0};
  metadata::CallsiteHandle   callsite;
  std::vector<record::Field> fields;
};

struct FollowsFromTrace {
  RecordedSpanId cause_id{0};
  RecordedSpanId effect_id{0};
};

using DispatchableTrace = std::variant<RegisterCallsiteTrace, EventTrace, NewSpanTrace, EnterTrace, ExitTrace, CloseTrace, RecordTrace,
                                       FollowsFromTrace>;

struct WorkItem {
  util::TimePoint   target_time;
  DispatchableTrace trace;
};

inline std::string_view TraceKindName(const DispatchableTrace& trace) {
  static constexpr std::string_view kNames[] = {
      "register_callsite", "event", "new_span", "enter", "exit", "close", "record", "follows_from",
  };
  return kNames[trace.index()];
}

} // namespace tracereplay::replay
