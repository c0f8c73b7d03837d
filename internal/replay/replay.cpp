#include "replay.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/record/field_value.hpp"

namespace tracereplay::replay {

using observability::StringField;
using observability::UintField;
namespace v1 = record::v1;

namespace {

RecordedParent ParentFromProto(bool has_parent, const v1::Parent& parent) {
  if (!has_parent) {
    return {};
  }
  switch (parent.kind_case()) {
    case v1::Parent::kRoot:
      return {dispatch::ParentKind::kRoot, 0};
    case v1::Parent::kExplicitSpanId:
      return {dispatch::ParentKind::kExplicit, parent.explicit_span_id()};
    case v1::Parent::kCurrent:
    case v1::Parent::KIND_NOT_SET:
      break;
  }
  return {};
}

} // namespace

Replay::Replay(dispatch::DispatchPtr dispatch, ReplayOptions options)
    : state_(std::make_shared<ReplayState>(std::move(dispatch), options)), router_(state_) {
}

Replay::~Replay() = default;

// ------------------------------------------------------------
// Reading
// ------------------------------------------------------------

ReplaySummary Replay::ReplayFile(const std::string& path) {
  record::RecordReader reader(path);
  TRACEREPLAY_LOG_INFO("replaying recording", {StringField("path", path)});
  return ReplayRecords(reader);
}

ReplaySummary Replay::ReplayStream(std::istream& in) {
  record::RecordReader reader(in);
  return ReplayRecords(reader);
}

ReplaySummary Replay::ReplayRecords(record::RecordReader& reader) {
  ReplaySummary   summary;
  v1::TraceRecord record;

  while (reader.Next(&record)) {
    ++summary.record_count;

    const auto target = TargetTime(record.meta());
    auto       trace  = Prepare(record);
    if (!trace) {
      continue;
    }

    const auto&                meta = record.meta();
    std::optional<std::string> thread_name;
    if (meta.has_thread_name()) {
      thread_name = meta.thread_name();
    }
    router_.Route(meta.thread_id(), thread_name, WorkItem{target, std::move(*trace)});
  }

  TRACEREPLAY_LOG_DEBUG("recording read", {UintField("records", summary.record_count)});
  return summary;
}

void Replay::Close() {
  auto failures = router_.Close();
  if (!failures.empty()) {
    throw util::ReplayCloseError(std::move(failures));
  }
}

// ------------------------------------------------------------
// Preparation
// ------------------------------------------------------------

// Runs on the reading thread in file order, so interning, span
// reservation and the span -> callsite binding are in place before any
// worker can look them up.
std::optional<DispatchableTrace> Replay::Prepare(const v1::TraceRecord& record) {
  auto& callsites = state_->callsites;

  switch (record.trace_case()) {
    case v1::TraceRecord::kRegisterCallsite:
      return RegisterCallsiteTrace{callsites.GetOrRegister(record.register_callsite())};

    case v1::TraceRecord::kEvent: {
      const auto& event = record.event();
      return EventTrace{callsites.GetOrRegister(event.metadata()), record::FromProto(event.fields()),
                        ParentFor(event.has_parent(), event.parent())};
    }

    case v1::TraceRecord::kNewSpan: {
      const auto& new_span = record.new_span();
      auto        handle   = callsites.GetOrRegister(new_span.metadata());
      // Resolved before the reservation so a span cannot name itself.
      auto parent = ParentFor(new_span.has_parent(), new_span.parent());
      if (!state_->span_ids.Reserve(new_span.id())) {
        observability::Metrics::Instance().RecordDropped("duplicate_span");
        return std::nullopt;
      }
      callsites.BindSpan(new_span.id(), handle);
      return NewSpanTrace{new_span.id(), handle, record::FromProto(new_span.fields()), parent};
    }

    case v1::TraceRecord::kEnter:
      if (!SpanSeen(record.enter().id(), "enter")) {
        return std::nullopt;
      }
      return EnterTrace{record.enter().id()};

    case v1::TraceRecord::kExit:
      if (!SpanSeen(record.exit().id(), "exit")) {
        return std::nullopt;
      }
      return ExitTrace{record.exit().id()};

    case v1::TraceRecord::kClose:
      if (!SpanSeen(record.close().id(), "close")) {
        return std::nullopt;
      }
      return CloseTrace{record.close().id()};

    case v1::TraceRecord::kRecordValues: {
      const auto& values = record.record_values();
      auto        handle = callsites.CallsiteForSpan(values.id());
      if (!handle) {
        TRACEREPLAY_LOG_DEBUG("record for a span that was never created, dropping", {UintField("span_id", values.id())});
        observability::Metrics::Instance().RecordDropped("unknown_span");
        return std::nullopt;
      }
      return RecordTrace{values.id(), *handle, record::FromProto(values.fields())};
    }

    case v1::TraceRecord::kFollowsFrom: {
      const auto& follows = record.follows_from();
      if (!SpanSeen(follows.effect_id(), "follows_from") || !SpanSeen(follows.cause_id(), "follows_from")) {
        return std::nullopt;
      }
      return FollowsFromTrace{follows.cause_id(), follows.effect_id()};
    }

    case v1::TraceRecord::TRACE_NOT_SET:
      break;
  }
  return std::nullopt;
}

// Span references are only routed once the NewSpan they name has been read.
// A worker may then wait on a Pending id only while that span's NewSpan sits
// earlier in some queue, never behind the waiting record in its own queue.
bool Replay::SpanSeen(RecordedSpanId id, std::string_view kind) const {
  if (state_->span_ids.StateOf(id) != span::SpanIdMap::State::kUnknown) {
    return true;
  }
  TRACEREPLAY_LOG_DEBUG("reference to a span not created yet, dropping", {StringField("kind", kind), UintField("span_id", id)});
  observability::Metrics::Instance().RecordDropped("unknown_span");
  return false;
}

RecordedParent Replay::ParentFor(bool has_parent, const v1::Parent& parent) const {
  auto recorded = ParentFromProto(has_parent, parent);
  if (recorded.kind == dispatch::ParentKind::kExplicit && state_->span_ids.StateOf(recorded.span) == span::SpanIdMap::State::kUnknown) {
    TRACEREPLAY_LOG_DEBUG("explicit parent not created yet, using the current span", {UintField("span_id", recorded.span)});
    return {};
  }
  return recorded;
}

util::TimePoint Replay::TargetTime(const v1::CaptureMeta& meta) {
  const auto now      = util::Now();
  const auto recorded = util::FromCaptureTime(meta.timestamp_s(), meta.timestamp_subsec_us());

  if (!time_delta_) {
    time_delta_ = recorded ? util::SaturatingSub(now, *recorded) : util::Duration::zero();
  }
  if (!recorded) {
    return now;
  }
  return util::CheckedAdd(*recorded, *time_delta_).value_or(now);
}

} // namespace tracereplay::replay
