#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace tracereplay::span {

// Span id as written in the recording.
using RecordedSpanId = std::uint64_t;

// Span id assigned by the live backend during this replay. Never zero.
using LiveSpanId = std::uint64_t;

/*
  Maps recorded span ids to the ids the live backend hands out on replay.

  Entry lifecycle (entries are never removed):

      Reserve          Resolve
    (none) ──► Pending ──────► Mapped(live)
                  │
                  └──────────► Unavailable
                 MarkUnavailable

  Lookup() blocks while an entry is Pending. Unavailable exists so that a
  span the backend declined to create releases its waiters instead of
  holding them forever.
*/
class SpanIdMap {
 public:
  enum class State {
    kUnknown,
    kPending,
    kMapped,
    kUnavailable,
  };

  // False if the id already has an entry; the existing entry is kept.
  bool Reserve(RecordedSpanId recorded);

  // Pending -> Mapped. False (and no change) from any other state.
  bool Resolve(RecordedSpanId recorded, LiveSpanId live);

  // Pending -> Unavailable. False (and no change) from any other state.
  bool MarkUnavailable(RecordedSpanId recorded);

  // Live id for a mapped span; nullopt for unknown or unavailable spans.
  // Waits while the entry is pending.
  std::optional<LiveSpanId> Lookup(RecordedSpanId recorded) const;

  // Non-blocking snapshot of an entry's state.
  State StateOf(RecordedSpanId recorded) const;

 private:
  struct Entry {
    State      state{State::kPending};
    LiveSpanId live{0};
  };

  mutable std::mutex                         mutex_;
  mutable std::condition_variable            cv_;
  std::unordered_map<RecordedSpanId, Entry> entries_;
};

} // namespace tracereplay::span
