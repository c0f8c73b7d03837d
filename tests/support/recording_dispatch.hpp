#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/dispatch/dispatch.hpp"
#include "internal/record/field_value.hpp"

namespace tracereplay::testing {

using dispatch::LiveSpanId;

struct DispatchCall {
  std::string                                      op;
  std::string                                      name;
  LiveSpanId                                       span{0};
  LiveSpanId                                       cause{0};
  dispatch::ParentKind                             parent_kind{dispatch::ParentKind::kCurrent};
  std::optional<LiveSpanId>                        parent;
  std::vector<std::pair<std::string, std::string>> fields;
};

/*
  Dispatch double that records every call. Configure the public knobs
  before replaying; they are read concurrently afterwards.
*/
class RecordingDispatch : public dispatch::Dispatch {
 public:
  std::set<std::string> disabled;        // callsite names reported as not enabled
  std::string           throw_on_event;  // event callsite name whose dispatch throws

  void RegisterCallsite(const metadata::Callsite& callsite) override {
    Push({"register", callsite.name});
  }

  bool IsEnabled(const metadata::Callsite& callsite) override {
    return disabled.count(callsite.name) == 0;
  }

  LiveSpanId NewSpan(const metadata::Callsite& callsite, const dispatch::ValueSet& values, const dispatch::ResolvedParent& parent) override {
    const LiveSpanId id = next_id_.fetch_add(1);
    DispatchCall     call{"new_span", callsite.name, id};
    call.parent_kind = parent.kind;
    call.parent      = parent.span;
    call.fields      = Render(values);
    Push(std::move(call));
    return id;
  }

  void Enter(LiveSpanId span) override {
    Push({"enter", "", span});
  }

  void Exit(LiveSpanId span) override {
    Push({"exit", "", span});
  }

  bool TryClose(LiveSpanId span) override {
    Push({"close", "", span});
    return true;
  }

  void Record(LiveSpanId span, const dispatch::ValueSet& values) override {
    DispatchCall call{"record", "", span};
    call.fields = Render(values);
    Push(std::move(call));
  }

  void RecordFollowsFrom(LiveSpanId effect, LiveSpanId cause) override {
    Push({"follows_from", "", effect, cause});
  }

  void Event(const metadata::Callsite& callsite, const dispatch::ValueSet& values, const dispatch::ResolvedParent& parent) override {
    if (callsite.name == throw_on_event) {
      throw std::runtime_error("backend rejected " + callsite.name);
    }
    DispatchCall call{"event", callsite.name};
    call.parent_kind = parent.kind;
    call.parent      = parent.span;
    call.fields      = Render(values);
    Push(std::move(call));
  }

  std::vector<DispatchCall> calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
  }

  std::vector<DispatchCall> CallsOf(const std::string& op) const {
    std::vector<DispatchCall> matching;
    for (auto& call : calls()) {
      if (call.op == op) {
        matching.push_back(std::move(call));
      }
    }
    return matching;
  }

  std::size_t CountOf(const std::string& op, const std::string& name = "") const {
    std::size_t count = 0;
    for (const auto& call : calls()) {
      if (call.op == op && (name.empty() || call.name == name)) {
        ++count;
      }
    }
    return count;
  }

  // Live id handed out for the span created from callsite `name`.
  std::optional<LiveSpanId> SpanNamed(const std::string& name) const {
    for (const auto& call : calls()) {
      if (call.op == "new_span" && call.name == name) {
        return call.span;
      }
    }
    return std::nullopt;
  }

 private:
  static std::vector<std::pair<std::string, std::string>> Render(const dispatch::ValueSet& values) {
    std::vector<std::pair<std::string, std::string>> rendered;
    for (const auto& entry : values) {
      rendered.emplace_back(std::string(entry.field.name), record::ToString(*entry.value));
    }
    return rendered;
  }

  void Push(DispatchCall call) {
    std::lock_guard lock(mutex_);
    calls_.push_back(std::move(call));
  }

  mutable std::mutex        mutex_;
  std::vector<DispatchCall> calls_;
  std::atomic<LiveSpanId>   next_id_{1};
};

} // namespace tracereplay::testing
