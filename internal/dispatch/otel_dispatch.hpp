#pragma once

#ifdef ENABLE_OTEL

#include <atomic>
#include <mutex>
#include <optional>
#include <unordered_map>

#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/tracer.h>

#include "internal/dispatch/dispatch.hpp"
#include "internal/dispatch/interest_filter.hpp"

namespace tracereplay::dispatch {

/*
  Backend that turns the replayed trace into OpenTelemetry spans.

    span          → OTel span, parent taken from the resolved parent
    field         → span attribute
    event         → span event on its parent (root events become
                    zero-length spans)
    follows_from  → "follows_from" span event on the effect span
    enter / exit  → nothing, OTel spans carry no per-thread activity

  A span ends when TryClose releases its last reference. Live children hold
  a reference on their parent.
*/
class OtelDispatch : public Dispatch {
 public:
  OtelDispatch(opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer, InterestFilter interest);
  ~OtelDispatch() override;

  void RegisterCallsite(const metadata::Callsite& callsite) override;
  bool IsEnabled(const metadata::Callsite& callsite) override;

  LiveSpanId NewSpan(const metadata::Callsite& callsite, const ValueSet& values, const ResolvedParent& parent) override;
  void       Enter(LiveSpanId span) override;
  void       Exit(LiveSpanId span) override;
  bool       TryClose(LiveSpanId span) override;
  void       Record(LiveSpanId span, const ValueSet& values) override;
  void       RecordFollowsFrom(LiveSpanId effect, LiveSpanId cause) override;

  void Event(const metadata::Callsite& callsite, const ValueSet& values, const ResolvedParent& parent) override;

 private:
  using SpanPtr = opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span>;

  struct SpanEntry {
    SpanPtr                   span;
    std::optional<LiveSpanId> parent;
    std::size_t               refs{1};
  };

  // Caller holds mutex_.
  SpanPtr FindLocked(std::optional<LiveSpanId> span) const;
  void    ReleaseLocked(LiveSpanId span);

  opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
  InterestFilter                                                 interest_;

  mutable std::mutex                        mutex_;
  std::unordered_map<LiveSpanId, SpanEntry> spans_;
  std::atomic<LiveSpanId>                   next_id_{1};
};

} // namespace tracereplay::dispatch

#endif
