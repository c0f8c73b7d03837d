#include "span_id_map.hpp"

#include "internal/observability/logging.hpp"

namespace tracereplay::span {

using observability::UintField;

bool SpanIdMap::Reserve(RecordedSpanId recorded) {
  std::lock_guard lock(mutex_);
  auto [it, inserted] = entries_.try_emplace(recorded);
  if (!inserted) {
    TRACEREPLAY_LOG_WARN("new span reuses a recorded span id that has already been seen", {UintField("span_id", recorded)});
  }
  return inserted;
}

bool SpanIdMap::Resolve(RecordedSpanId recorded, LiveSpanId live) {
  {
    std::lock_guard lock(mutex_);
    auto            it = entries_.find(recorded);
    if (it == entries_.end() || it->second.state != State::kPending) {
      TRACEREPLAY_LOG_WARN("span id resolved outside of the pending state", {UintField("span_id", recorded), UintField("live_id", live)});
      return false;
    }
    it->second.state = State::kMapped;
    it->second.live  = live;
  }
  cv_.notify_all();
  return true;
}

bool SpanIdMap::MarkUnavailable(RecordedSpanId recorded) {
  {
    std::lock_guard lock(mutex_);
    auto            it = entries_.find(recorded);
    if (it == entries_.end() || it->second.state != State::kPending) {
      return false;
    }
    it->second.state = State::kUnavailable;
  }
  cv_.notify_all();
  return true;
}

std::optional<LiveSpanId> SpanIdMap::Lookup(RecordedSpanId recorded) const {
  std::unique_lock lock(mutex_);
  auto             it = entries_.find(recorded);
  if (it == entries_.end()) {
    return std::nullopt;
  }

  // Element references survive rehashing by concurrent Reserve() calls.
  const Entry& entry = it->second;
  cv_.wait(lock, [&] { return entry.state != State::kPending; });

  if (entry.state == State::kMapped) {
    return entry.live;
  }
  return std::nullopt;
}

SpanIdMap::State SpanIdMap::StateOf(RecordedSpanId recorded) const {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(recorded);
  if (it == entries_.end()) {
    return State::kUnknown;
  }
  return it->second.state;
}

} // namespace tracereplay::span
