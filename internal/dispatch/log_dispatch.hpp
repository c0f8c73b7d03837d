#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

#include "internal/dispatch/dispatch.hpp"
#include "internal/dispatch/interest_filter.hpp"

namespace tracereplay::dispatch {

struct LogDispatchOptions {
  InterestFilter interest;
  bool           span_events{false};
};

/*
  Backend that renders the replayed trace as log lines.

  Each event becomes one line carrying the chain of spans it happened in:

      INFO  app::db: query{table=users}:fetch{}: row loaded id=7

  Spans are reference counted the way a subscriber registry counts them: a
  span holds one reference for itself and one per live child, so a parent
  stays resolvable until its last child closes.
*/
class LogDispatch : public Dispatch {
 public:
  LogDispatch(std::shared_ptr<spdlog::logger> logger, LogDispatchOptions options);

  void RegisterCallsite(const metadata::Callsite& callsite) override;
  bool IsEnabled(const metadata::Callsite& callsite) override;

  LiveSpanId NewSpan(const metadata::Callsite& callsite, const ValueSet& values, const ResolvedParent& parent) override;
  void       Enter(LiveSpanId span) override;
  void       Exit(LiveSpanId span) override;
  bool       TryClose(LiveSpanId span) override;
  void       Record(LiveSpanId span, const ValueSet& values) override;
  void       RecordFollowsFrom(LiveSpanId effect, LiveSpanId cause) override;

  void Event(const metadata::Callsite& callsite, const ValueSet& values, const ResolvedParent& parent) override;

  // Spans created and not yet fully closed.
  std::size_t open_spans() const;

 private:
  struct SpanData {
    std::string               name;
    std::string               target;
    metadata::Level           level{metadata::Level::kTrace};
    std::string               fields;
    std::optional<LiveSpanId> parent;
    std::size_t               refs{1};
  };

  // Caller holds mutex_.
  std::string ScopeLocked(std::optional<LiveSpanId> leaf) const;
  void        ReleaseLocked(LiveSpanId span);
  void        LogSpanEvent(LiveSpanId span, const char* what);

  std::shared_ptr<spdlog::logger> logger_;
  LogDispatchOptions              options_;

  mutable std::mutex                       mutex_;
  std::unordered_map<LiveSpanId, SpanData> spans_;
  std::atomic<LiveSpanId>                  next_id_{1};
};

} // namespace tracereplay::dispatch
