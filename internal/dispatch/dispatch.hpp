#pragma once

#include <memory>
#include <optional>

#include "internal/dispatch/value_set.hpp"
#include "internal/metadata/callsite.hpp"
#include "internal/span/span_id_map.hpp"

namespace tracereplay::dispatch {

using span::LiveSpanId;

enum class ParentKind {
  kRoot,
  kCurrent,
  kExplicit,
};

/*
  Parent of a new span or event, already translated to live ids.

    kRoot     → span is empty
    kCurrent  → span is the dispatching thread's current span, if any
    kExplicit → span is the mapped explicit parent
*/
struct ResolvedParent {
  ParentKind                kind{ParentKind::kCurrent};
  std::optional<LiveSpanId> span;
};

/*
  Live observability backend that replayed records are issued against.

  The backend is authoritative for span identity (NewSpan hands out the
  ids) and for interest (IsEnabled). One instance is shared by every replay
  worker, so implementations must be safe to call from several threads at
  once.

  Implementations:
    LOG   → renders spans and events through spdlog
    OTLP  → OpenTelemetry spans (ENABLE_OTEL builds)
*/
class Dispatch {
 public:
  virtual ~Dispatch() = default;

  // ------------------------------------------------------------------
  // Callsites
  // ------------------------------------------------------------------
  /*
    Called once per callsite, before the callsite is used.
  */
  virtual void RegisterCallsite(const metadata::Callsite& callsite) = 0;

  virtual bool IsEnabled(const metadata::Callsite& callsite) = 0;

  // ------------------------------------------------------------------
  // Spans
  // ------------------------------------------------------------------
  /*
    Create a span and return its live id (never zero). The span starts with
    one reference.
  */
  virtual LiveSpanId NewSpan(const metadata::Callsite& callsite, const ValueSet& values, const ResolvedParent& parent) = 0;

  virtual void Enter(LiveSpanId span) = 0;
  virtual void Exit(LiveSpanId span)  = 0;

  /*
    Drop one reference. Returns true if that was the last one and the span
    is now closed.
  */
  virtual bool TryClose(LiveSpanId span) = 0;

  /*
    Attach late-bound field values to an existing span.
  */
  virtual void Record(LiveSpanId span, const ValueSet& values) = 0;

  virtual void RecordFollowsFrom(LiveSpanId effect, LiveSpanId cause) = 0;

  // ------------------------------------------------------------------
  // Events
  // ------------------------------------------------------------------
  virtual void Event(const metadata::Callsite& callsite, const ValueSet& values, const ResolvedParent& parent) = 0;
};

using DispatchPtr = std::shared_ptr<Dispatch>;

} // namespace tracereplay::dispatch
