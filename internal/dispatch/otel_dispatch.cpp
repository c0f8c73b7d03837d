#include "internal/dispatch/otel_dispatch.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/span_startoptions.h>

#include <cstdint>
#include <deque>
#include <string>
#include <utility>
#include <vector>

namespace tracereplay::dispatch {
namespace trace_api = opentelemetry::trace;
namespace nostd     = opentelemetry::nostd;
namespace common    = opentelemetry::common;

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

/*
  Attribute list for a single SDK call. Views handed to the SDK point into
  text_ (a deque, so earlier entries never move), into the callsite arena or
  into the recorded field values, all of which outlive the call.
*/
class AttributeList {
 public:
  using Item = std::pair<nostd::string_view, common::AttributeValue>;

  void AddText(nostd::string_view key, std::string text) {
    text_.push_back(std::move(text));
    items_.emplace_back(key, nostd::string_view(text_.back()));
  }

  void AddValue(std::string_view key, const record::FieldValue& value) {
    const nostd::string_view k(key.data(), key.size());
    std::visit(Overloaded{
                   [&](const record::DebugText& v) { items_.emplace_back(k, nostd::string_view(v.text)); },
                   [&](double v) { items_.emplace_back(k, v); },
                   [&](int64_t v) { items_.emplace_back(k, v); },
                   [&](uint64_t v) { items_.emplace_back(k, v); },
                   [&](record::Int128 v) { AddText(k, record::FormatInt128(v)); },
                   [&](record::Uint128 v) { AddText(k, record::FormatUint128(v)); },
                   [&](bool v) { items_.emplace_back(k, v); },
                   [&](const record::StrText& v) { items_.emplace_back(k, nostd::string_view(v.text)); },
               },
               value);
  }

  void AddValues(const ValueSet& values) {
    for (const auto& entry : values) {
      AddValue(entry.field.name, *entry.value);
    }
  }

  void AddCallsite(const metadata::Callsite& callsite) {
    items_.emplace_back("target", nostd::string_view(callsite.target));
    const auto level = metadata::LevelName(callsite.level);
    items_.emplace_back("level", nostd::string_view(level.data(), level.size()));
    if (callsite.module_path) {
      items_.emplace_back("code.namespace", nostd::string_view(*callsite.module_path));
    }
    if (callsite.file) {
      items_.emplace_back("code.filepath", nostd::string_view(*callsite.file));
    }
    if (callsite.line) {
      items_.emplace_back("code.lineno", static_cast<int64_t>(*callsite.line));
    }
  }

  const std::vector<Item>& items() const {
    return items_;
  }

 private:
  std::deque<std::string> text_;
  std::vector<Item>       items_;
};

} // namespace

OtelDispatch::OtelDispatch(nostd::shared_ptr<trace_api::Tracer> tracer, InterestFilter interest)
    : tracer_(std::move(tracer)), interest_(std::move(interest)) {
}

OtelDispatch::~OtelDispatch() {
  // Spans still open at teardown were never closed in the recording; end
  // them so the exporter sees them.
  std::lock_guard lock(mutex_);
  for (auto& [id, entry] : spans_) {
    entry.span->End();
  }
  spans_.clear();
}

// ------------------------------------------------------------
// Callsites
// ------------------------------------------------------------

void OtelDispatch::RegisterCallsite(const metadata::Callsite&) {
}

bool OtelDispatch::IsEnabled(const metadata::Callsite& callsite) {
  return interest_.Allows(callsite);
}

// ------------------------------------------------------------
// Spans
// ------------------------------------------------------------

LiveSpanId OtelDispatch::NewSpan(const metadata::Callsite& callsite, const ValueSet& values, const ResolvedParent& parent) {
  AttributeList attributes;
  attributes.AddCallsite(callsite);
  attributes.AddValues(values);

  trace_api::StartSpanOptions options;
  options.kind = trace_api::SpanKind::kInternal;

  const LiveSpanId id = next_id_.fetch_add(1);

  std::lock_guard lock(mutex_);
  SpanEntry       entry;
  if (parent.kind == ParentKind::kRoot || !parent.span) {
    options.parent = trace_api::SpanContext::GetInvalid();
  } else if (auto parent_it = spans_.find(*parent.span); parent_it != spans_.end()) {
    options.parent = parent_it->second.span->GetContext();
    ++parent_it->second.refs;
    entry.parent = parent.span;
  } else {
    options.parent = trace_api::SpanContext::GetInvalid();
  }

  entry.span = tracer_->StartSpan(callsite.name, attributes.items(), options);
  spans_.emplace(id, std::move(entry));
  return id;
}

void OtelDispatch::Enter(LiveSpanId) {
}

void OtelDispatch::Exit(LiveSpanId) {
}

bool OtelDispatch::TryClose(LiveSpanId span) {
  std::lock_guard lock(mutex_);
  auto            it = spans_.find(span);
  if (it == spans_.end()) {
    return false;
  }
  if (it->second.refs > 1) {
    --it->second.refs;
    return false;
  }
  ReleaseLocked(span);
  return true;
}

void OtelDispatch::Record(LiveSpanId span, const ValueSet& values) {
  AttributeList attributes;
  attributes.AddValues(values);

  std::lock_guard lock(mutex_);
  auto            target = FindLocked(span);
  if (!target) {
    return;
  }
  for (const auto& [key, value] : attributes.items()) {
    target->SetAttribute(key, value);
  }
}

void OtelDispatch::RecordFollowsFrom(LiveSpanId effect, LiveSpanId cause) {
  std::lock_guard lock(mutex_);
  auto            effect_span = FindLocked(effect);
  auto            cause_span  = FindLocked(cause);
  if (!effect_span || !cause_span) {
    return;
  }

  auto    context = cause_span->GetContext();
  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);

  AttributeList attributes;
  attributes.AddText("cause.trace_id", HexId(trace_bytes, 16));
  attributes.AddText("cause.span_id", HexId(span_bytes, 8));
  effect_span->AddEvent("follows_from", attributes.items());
}

// ------------------------------------------------------------
// Events
// ------------------------------------------------------------

void OtelDispatch::Event(const metadata::Callsite& callsite, const ValueSet& values, const ResolvedParent& parent) {
  AttributeList attributes;
  attributes.AddCallsite(callsite);
  attributes.AddValues(values);

  {
    std::lock_guard lock(mutex_);
    auto            parent_span = parent.kind == ParentKind::kRoot ? SpanPtr{} : FindLocked(parent.span);
    if (parent_span) {
      parent_span->AddEvent(callsite.name, attributes.items());
      if (callsite.level == metadata::Level::kError) {
        parent_span->SetStatus(trace_api::StatusCode::kError, callsite.name);
      }
      return;
    }
  }

  trace_api::StartSpanOptions options;
  options.parent = trace_api::SpanContext::GetInvalid();
  auto span      = tracer_->StartSpan(callsite.name, attributes.items(), options);
  span->End();
}

// ------------------------------------------------------------
// Internals
// ------------------------------------------------------------

OtelDispatch::SpanPtr OtelDispatch::FindLocked(std::optional<LiveSpanId> span) const {
  if (!span) {
    return SpanPtr{};
  }
  auto it = spans_.find(*span);
  if (it == spans_.end()) {
    return SpanPtr{};
  }
  return it->second.span;
}

void OtelDispatch::ReleaseLocked(LiveSpanId span) {
  std::optional<LiveSpanId> next = span;
  while (next) {
    auto it = spans_.find(*next);
    if (it == spans_.end()) {
      return;
    }
    if (--it->second.refs > 0) {
      return;
    }
    it->second.span->End();
    next = it->second.parent;
    spans_.erase(it);
  }
}

} // namespace tracereplay::dispatch

#endif
