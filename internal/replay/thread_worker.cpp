#include "thread_worker.hpp"

#include <pthread.h>

#include <chrono>
#include <system_error>
#include <utility>

#include "internal/dispatch/value_set.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/util/errors.hpp"

namespace tracereplay::replay {

using observability::StringField;
using observability::UintField;

namespace {

// Linux limits thread names to 15 bytes plus the terminator.
constexpr std::size_t kMaxThreadNameLength = 15;

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void NameCurrentThread(const std::string& name) {
  const auto truncated = name.substr(0, kMaxThreadNameLength);
  pthread_setname_np(pthread_self(), truncated.c_str());
}

void DropUnknownSpan(std::string_view kind, RecordedSpanId id) {
  TRACEREPLAY_LOG_DEBUG("skipping record for a span that never became live", {StringField("kind", kind), UintField("span_id", id)});
  observability::Metrics::Instance().RecordDropped("unknown_span");
}

} // namespace

ThreadWorker::ThreadWorker(std::shared_ptr<ReplayState> state, std::string thread_id, std::optional<std::string> thread_name)
    : state_(std::move(state)), thread_id_(std::move(thread_id)), thread_name_(std::move(thread_name)) {
}

ThreadWorker::~ThreadWorker() {
  if (thread_.joinable()) {
    queue_.Shutdown();
    thread_.join();
  }
}

void ThreadWorker::Start() {
  try {
    thread_ = std::thread(&ThreadWorker::Run, this);
  } catch (const std::system_error& e) {
    throw util::ThreadSpawnError("failed to spawn replay worker for thread " + thread_id_ + ": " + e.what());
  }
}

bool ThreadWorker::Submit(WorkItem item) {
  std::optional<RecordedSpanId> reserved;
  if (const auto* new_span = std::get_if<NewSpanTrace>(&item.trace)) {
    reserved = new_span->id;
  }

  if (queue_.Push(std::move(item))) {
    return true;
  }
  if (reserved) {
    state_->span_ids.MarkUnavailable(*reserved);
  }
  return false;
}

std::optional<std::string> ThreadWorker::Stop() {
  queue_.Shutdown();
  if (thread_.joinable()) {
    thread_.join();
  }

  std::lock_guard lock(failure_mutex_);
  return failure_;
}

// ------------------------------------------------------------
// Worker loop
// ------------------------------------------------------------

void ThreadWorker::Run() {
  if (thread_name_) {
    NameCurrentThread(*thread_name_);
  }

  while (auto item = queue_.Pop()) {
    WaitForTarget(item->target_time);

    try {
      Handle(item->trace);
    } catch (const std::exception& e) {
      TRACEREPLAY_LOG_ERROR("replay worker failed",
                            {StringField("thread_id", thread_id_), StringField("kind", TraceKindName(item->trace)), StringField("error", e.what())});
      {
        std::lock_guard lock(failure_mutex_);
        failure_ = e.what();
      }
      for (const auto& discarded : queue_.Abandon()) {
        ReleaseReservation(discarded.trace);
      }
      return;
    }
    observability::Metrics::Instance().RecordDispatched(TraceKindName(item->trace));
  }
}

void ThreadWorker::WaitForTarget(util::TimePoint target_time) const {
  if (!state_->options.pace) {
    return;
  }

  const auto now = util::Now();
  if (target_time > now) {
    std::this_thread::sleep_until(target_time);
    return;
  }

  const std::chrono::duration<double, std::milli> lag = now - target_time;
  observability::Metrics::Instance().ObservePacingLagMs(lag.count());
}

void ThreadWorker::Handle(const DispatchableTrace& trace) {
  std::visit(Overloaded{
                 [&](const RegisterCallsiteTrace& t) { HandleRegisterCallsite(t); },
                 [&](const EventTrace& t) { HandleEvent(t); },
                 [&](const NewSpanTrace& t) { HandleNewSpan(t); },
                 [&](const EnterTrace& t) { HandleEnter(t); },
                 [&](const ExitTrace& t) { HandleExit(t); },
                 [&](const CloseTrace& t) { HandleClose(t); },
                 [&](const RecordTrace& t) { HandleRecord(t); },
                 [&](const FollowsFromTrace& t) { HandleFollowsFrom(t); },
             },
             trace);
}

// ------------------------------------------------------------
// Callsites and events
// ------------------------------------------------------------

void ThreadWorker::HandleRegisterCallsite(const RegisterCallsiteTrace& trace) {
  EnsureRegistered(trace.callsite);
}

void ThreadWorker::HandleEvent(const EventTrace& trace) {
  const auto& callsite = EnsureRegistered(trace.callsite);
  if (!state_->dispatch->IsEnabled(callsite)) {
    observability::Metrics::Instance().RecordDropped("disabled");
    return;
  }

  auto values = dispatch::BuildValueSet(callsite, trace.fields);
  state_->dispatch->Event(callsite, values, ResolveParent(trace.parent));
}

// ------------------------------------------------------------
// Spans
// ------------------------------------------------------------

void ThreadWorker::HandleNewSpan(const NewSpanTrace& trace) {
  const auto& callsite = EnsureRegistered(trace.callsite);
  if (!state_->dispatch->IsEnabled(callsite)) {
    state_->span_ids.MarkUnavailable(trace.id);
    observability::Metrics::Instance().RecordDropped("disabled");
    return;
  }

  auto values = dispatch::BuildValueSet(callsite, trace.fields);

  dispatch::LiveSpanId live = 0;
  try {
    live = state_->dispatch->NewSpan(callsite, values, ResolveParent(trace.parent));
  } catch (const std::exception&) {
    // Waiters on other threads must not block on a span that will never exist.
    state_->span_ids.MarkUnavailable(trace.id);
    throw;
  }

  if (live == 0) {
    TRACEREPLAY_LOG_WARN("backend returned no span id", {StringField("name", callsite.name), UintField("span_id", trace.id)});
    state_->span_ids.MarkUnavailable(trace.id);
    return;
  }

  if (!state_->span_ids.Resolve(trace.id, live)) {
    TRACEREPLAY_LOG_WARN("span id was not pending, live span left unmapped", {UintField("span_id", trace.id), UintField("live_id", live)});
  }
}

void ThreadWorker::HandleEnter(const EnterTrace& trace) {
  auto live = state_->span_ids.Lookup(trace.id);
  if (!live) {
    DropUnknownSpan("enter", trace.id);
    return;
  }
  context_.Enter(*live);
  state_->dispatch->Enter(*live);
}

void ThreadWorker::HandleExit(const ExitTrace& trace) {
  auto live = state_->span_ids.Lookup(trace.id);
  if (!live) {
    DropUnknownSpan("exit", trace.id);
    return;
  }
  state_->dispatch->Exit(*live);
  if (!context_.Exit(*live)) {
    TRACEREPLAY_LOG_DEBUG("exit without matching enter on this thread", {StringField("thread_id", thread_id_), UintField("span_id", trace.id)});
  }
}

void ThreadWorker::HandleClose(const CloseTrace& trace) {
  auto live = state_->span_ids.Lookup(trace.id);
  if (!live) {
    DropUnknownSpan("close", trace.id);
    return;
  }
  state_->dispatch->TryClose(*live);
}

void ThreadWorker::HandleRecord(const RecordTrace& trace) {
  auto live = state_->span_ids.Lookup(trace.id);
  if (!live) {
    DropUnknownSpan("record", trace.id);
    return;
  }

  const auto& callsite = EnsureRegistered(trace.callsite);
  auto        values   = dispatch::BuildValueSet(callsite, trace.fields);
  state_->dispatch->Record(*live, values);
}

void ThreadWorker::HandleFollowsFrom(const FollowsFromTrace& trace) {
  auto effect = state_->span_ids.Lookup(trace.effect_id);
  if (!effect) {
    DropUnknownSpan("follows_from", trace.effect_id);
    return;
  }
  auto cause = state_->span_ids.Lookup(trace.cause_id);
  if (!cause) {
    DropUnknownSpan("follows_from", trace.cause_id);
    return;
  }
  state_->dispatch->RecordFollowsFrom(*effect, *cause);
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------

void ThreadWorker::ReleaseReservation(const DispatchableTrace& trace) {
  if (const auto* new_span = std::get_if<NewSpanTrace>(&trace)) {
    state_->span_ids.MarkUnavailable(new_span->id);
  }
}

const metadata::Callsite& ThreadWorker::EnsureRegistered(metadata::CallsiteHandle handle) {
  state_->callsites.RegisterOnce(handle, [&](const metadata::Callsite& callsite) { state_->dispatch->RegisterCallsite(callsite); });
  return state_->callsites.Get(handle);
}

dispatch::ResolvedParent ThreadWorker::ResolveParent(const RecordedParent& parent) const {
  switch (parent.kind) {
    case dispatch::ParentKind::kRoot:
      return {dispatch::ParentKind::kRoot, std::nullopt};
    case dispatch::ParentKind::kExplicit:
      if (auto live = state_->span_ids.Lookup(parent.span)) {
        return {dispatch::ParentKind::kExplicit, live};
      }
      TRACEREPLAY_LOG_DEBUG("explicit parent never became live, using the current span", {UintField("span_id", parent.span)});
      break;
    case dispatch::ParentKind::kCurrent:
      break;
  }
  return {dispatch::ParentKind::kCurrent, context_.Current()};
}

} // namespace tracereplay::replay
