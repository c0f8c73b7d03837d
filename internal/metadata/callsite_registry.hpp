#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

#include "callsite.hpp"
#include "tracereplay/record/v1/record.pb.h"

namespace tracereplay::metadata {

// Stable index into the registry arena.
struct CallsiteHandle {
  std::size_t index{0};

  bool operator==(const CallsiteHandle&) const = default;
};

/*
  Interning table for recorded callsites.

  Keyed by the capture-time metadata id. The arena only grows: a handle and
  the Callsite it refers to stay valid until the registry is destroyed,
  which for the CLI is the end of the process.

  Also tracks which recorded span was created from which callsite, so a
  later Record(span, fields) knows the field set it may use.
*/
class CallsiteRegistry {
 public:
  // Same capture id always yields the same handle. The first definition of
  // an id wins.
  CallsiteHandle GetOrRegister(const record::v1::Metadata& metadata);

  std::optional<CallsiteHandle> Find(uint64_t capture_id) const;

  const Callsite& Get(CallsiteHandle handle) const;

  // Runs `hook` once per callsite across all threads. Callers racing on the
  // same callsite wait until the winning hook has returned. If the hook
  // throws, the next caller runs it again. True for the caller whose hook ran.
  //
  // The per-callsite lock is held while `hook` calls into the backend; it is
  // the only lock held across a backend call, and it never blocks other
  // callsites.
  bool RegisterOnce(CallsiteHandle handle, const std::function<void(const Callsite&)>& hook);

  void                          BindSpan(uint64_t recorded_span_id, CallsiteHandle handle);
  std::optional<CallsiteHandle> CallsiteForSpan(uint64_t recorded_span_id) const;

  std::size_t size() const;

 private:
  struct Entry {
    explicit Entry(Callsite c) : callsite(std::move(c)) {
    }

    Callsite   callsite;
    std::mutex register_mutex;
    bool       registered{false};
  };

  Entry& EntryFor(CallsiteHandle handle);

  mutable std::shared_mutex                    mutex_;
  std::deque<Entry>                            arena_;
  std::unordered_map<uint64_t, CallsiteHandle> by_capture_id_;
  std::unordered_map<uint64_t, CallsiteHandle> by_span_id_;
};

} // namespace tracereplay::metadata
