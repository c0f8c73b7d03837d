#include "log_dispatch.hpp"

#include <utility>

namespace tracereplay::dispatch {

namespace {

constexpr std::string_view kMessageField = "message";

spdlog::level::level_enum ToSpdlogLevel(metadata::Level level) {
  switch (level) {
    case metadata::Level::kTrace:
      return spdlog::level::trace;
    case metadata::Level::kDebug:
      return spdlog::level::debug;
    case metadata::Level::kInfo:
      return spdlog::level::info;
    case metadata::Level::kWarn:
      return spdlog::level::warn;
    case metadata::Level::kError:
      return spdlog::level::err;
  }
  return spdlog::level::info;
}

// `message` renders bare and first, everything else as key=value.
std::string RenderFields(const ValueSet& values) {
  std::string message;
  std::string rest;
  for (const auto& entry : values) {
    auto text = record::ToString(*entry.value);
    if (entry.field.name == kMessageField) {
      message = std::move(text);
      continue;
    }
    if (!rest.empty()) {
      rest += ' ';
    }
    rest += std::string(entry.field.name) + "=" + text;
  }

  if (message.empty()) {
    return rest;
  }
  if (rest.empty()) {
    return message;
  }
  return message + " " + rest;
}

std::string Location(const metadata::Callsite& callsite) {
  if (!callsite.file) {
    return {};
  }
  if (!callsite.line) {
    return *callsite.file + ": ";
  }
  return *callsite.file + ":" + std::to_string(*callsite.line) + ": ";
}

} // namespace

LogDispatch::LogDispatch(std::shared_ptr<spdlog::logger> logger, LogDispatchOptions options)
    : logger_(std::move(logger)), options_(std::move(options)) {
}

// ------------------------------------------------------------
// Callsites
// ------------------------------------------------------------

void LogDispatch::RegisterCallsite(const metadata::Callsite& callsite) {
  logger_->trace("registered callsite {} ({}) id={}", callsite.name, callsite.target, callsite.capture_id);
}

bool LogDispatch::IsEnabled(const metadata::Callsite& callsite) {
  return options_.interest.Allows(callsite);
}

// ------------------------------------------------------------
// Spans
// ------------------------------------------------------------

LiveSpanId LogDispatch::NewSpan(const metadata::Callsite& callsite, const ValueSet& values, const ResolvedParent& parent) {
  const LiveSpanId id = next_id_.fetch_add(1);

  SpanData data;
  data.name   = callsite.name;
  data.target = callsite.target;
  data.level  = callsite.level;
  data.fields = RenderFields(values);

  {
    std::lock_guard lock(mutex_);
    if (parent.kind != ParentKind::kRoot && parent.span) {
      auto it = spans_.find(*parent.span);
      if (it != spans_.end()) {
        ++it->second.refs;
        data.parent = parent.span;
      }
    }
    spans_.emplace(id, std::move(data));
  }

  if (options_.span_events) {
    LogSpanEvent(id, "new");
  }
  return id;
}

void LogDispatch::Enter(LiveSpanId span) {
  if (options_.span_events) {
    LogSpanEvent(span, "enter");
  }
}

void LogDispatch::Exit(LiveSpanId span) {
  if (options_.span_events) {
    LogSpanEvent(span, "exit");
  }
}

bool LogDispatch::TryClose(LiveSpanId span) {
  std::lock_guard lock(mutex_);
  auto            it = spans_.find(span);
  if (it == spans_.end()) {
    return false;
  }
  if (it->second.refs > 1) {
    --it->second.refs;
    return false;
  }

  if (options_.span_events) {
    auto scope = ScopeLocked(span);
    logger_->log(ToSpdlogLevel(it->second.level), "{}: {}: close", it->second.target, scope);
  }
  ReleaseLocked(span);
  return true;
}

void LogDispatch::Record(LiveSpanId span, const ValueSet& values) {
  auto rendered = RenderFields(values);
  if (rendered.empty()) {
    return;
  }

  std::lock_guard lock(mutex_);
  auto            it = spans_.find(span);
  if (it == spans_.end()) {
    return;
  }
  auto& fields = it->second.fields;
  if (!fields.empty()) {
    fields += ' ';
  }
  fields += rendered;
}

void LogDispatch::RecordFollowsFrom(LiveSpanId effect, LiveSpanId cause) {
  if (!options_.span_events) {
    return;
  }

  std::lock_guard lock(mutex_);
  auto            effect_it = spans_.find(effect);
  auto            cause_it  = spans_.find(cause);
  if (effect_it == spans_.end() || cause_it == spans_.end()) {
    return;
  }
  logger_->log(ToSpdlogLevel(effect_it->second.level), "{}: {}: follows_from {}", effect_it->second.target, ScopeLocked(effect),
               cause_it->second.name);
}

// ------------------------------------------------------------
// Events
// ------------------------------------------------------------

void LogDispatch::Event(const metadata::Callsite& callsite, const ValueSet& values, const ResolvedParent& parent) {
  std::string scope;
  if (parent.kind != ParentKind::kRoot && parent.span) {
    std::lock_guard lock(mutex_);
    scope = ScopeLocked(parent.span);
  }

  auto fields = RenderFields(values);
  if (scope.empty()) {
    logger_->log(ToSpdlogLevel(callsite.level), "{}: {}{}", callsite.target, Location(callsite), fields);
    return;
  }
  logger_->log(ToSpdlogLevel(callsite.level), "{}: {}{}: {}", callsite.target, Location(callsite), scope, fields);
}

std::size_t LogDispatch::open_spans() const {
  std::lock_guard lock(mutex_);
  return spans_.size();
}

// ------------------------------------------------------------
// Internals
// ------------------------------------------------------------

std::string LogDispatch::ScopeLocked(std::optional<LiveSpanId> leaf) const {
  std::vector<const SpanData*> chain;
  while (leaf) {
    auto it = spans_.find(*leaf);
    if (it == spans_.end()) {
      break;
    }
    chain.push_back(&it->second);
    leaf = it->second.parent;
  }

  std::string scope;
  for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
    if (!scope.empty()) {
      scope += ':';
    }
    scope += (*it)->name + "{" + (*it)->fields + "}";
  }
  return scope;
}

void LogDispatch::ReleaseLocked(LiveSpanId span) {
  std::optional<LiveSpanId> next = span;
  while (next) {
    auto it = spans_.find(*next);
    if (it == spans_.end()) {
      return;
    }
    if (--it->second.refs > 0) {
      return;
    }
    next = it->second.parent;
    spans_.erase(it);
  }
}

void LogDispatch::LogSpanEvent(LiveSpanId span, const char* what) {
  std::lock_guard lock(mutex_);
  auto            it = spans_.find(span);
  if (it == spans_.end()) {
    return;
  }
  logger_->log(ToSpdlogLevel(it->second.level), "{}: {}: {}", it->second.target, ScopeLocked(span), what);
}

} // namespace tracereplay::dispatch
