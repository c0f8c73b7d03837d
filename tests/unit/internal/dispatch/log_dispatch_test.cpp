#include "internal/dispatch/log_dispatch.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

using tracereplay::dispatch::BuildValueSet;
using tracereplay::dispatch::LogDispatch;
using tracereplay::dispatch::LogDispatchOptions;
using tracereplay::dispatch::ParentKind;
using tracereplay::dispatch::ResolvedParent;
using tracereplay::metadata::Callsite;
using tracereplay::metadata::Level;
using tracereplay::record::Field;
using tracereplay::record::StrText;

struct Harness {
  explicit Harness(LogDispatchOptions options = {}) {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    logger    = std::make_shared<spdlog::logger>("log_dispatch_test", sink);
    logger->set_pattern("%l %v");
    logger->set_level(spdlog::level::trace);
    dispatch = std::make_unique<LogDispatch>(logger, std::move(options));
  }

  std::string Output() {
    logger->flush();
    return out.str();
  }

  std::ostringstream              out;
  std::shared_ptr<spdlog::logger> logger;
  std::unique_ptr<LogDispatch>    dispatch;
};

Callsite MakeCallsite(const std::string& name, Level level, std::vector<std::string> fields, const std::string& target = "app::http") {
  Callsite callsite;
  callsite.name        = name;
  callsite.target      = target;
  callsite.level       = level;
  callsite.file        = "src/server.rs";
  callsite.line        = 12;
  callsite.field_names = std::move(fields);
  return callsite;
}

void TestEventRendersSpanScope() {
  Harness harness;
  auto    request = MakeCallsite("request", Level::kInfo, {"path"});
  auto    handled = MakeCallsite("handled", Level::kWarn, {"message", "status"});

  std::vector<Field> span_fields  = {{"path", StrText{"/x"}}};
  std::vector<Field> event_fields = {{"status", static_cast<int64_t>(503)}, {"message", StrText{"slow"}}};

  auto span = harness.dispatch->NewSpan(request, BuildValueSet(request, span_fields), ResolvedParent{ParentKind::kRoot, std::nullopt});
  assert(span != 0);

  harness.dispatch->Event(handled, BuildValueSet(handled, event_fields), ResolvedParent{ParentKind::kCurrent, span});

  const auto output = harness.Output();
  assert(output.find("warning app::http: src/server.rs:12: request{path=/x}: slow status=503") != std::string::npos);
}

void TestRecordExtendsSpanFields() {
  Harness harness;
  auto    query = MakeCallsite("query", Level::kDebug, {"table", "rows"});
  auto    done  = MakeCallsite("done", Level::kInfo, {});

  std::vector<Field> initial = {{"table", StrText{"users"}}};
  std::vector<Field> later   = {{"rows", static_cast<uint64_t>(3)}};

  auto span = harness.dispatch->NewSpan(query, BuildValueSet(query, initial), ResolvedParent{});
  harness.dispatch->Record(span, BuildValueSet(query, later));
  harness.dispatch->Event(done, BuildValueSet(done, {}), ResolvedParent{ParentKind::kExplicit, span});

  assert(harness.Output().find("query{table=users rows=3}") != std::string::npos);
}

void TestParentOutlivesChildUntilLastClose() {
  Harness harness;
  auto    callsite = MakeCallsite("outer", Level::kInfo, {});

  auto parent = harness.dispatch->NewSpan(callsite, BuildValueSet(callsite, {}), ResolvedParent{ParentKind::kRoot, std::nullopt});
  auto child  = harness.dispatch->NewSpan(callsite, BuildValueSet(callsite, {}), ResolvedParent{ParentKind::kCurrent, parent});
  assert(parent != child);
  assert(harness.dispatch->open_spans() == 2);

  assert(!harness.dispatch->TryClose(parent));
  assert(harness.dispatch->open_spans() == 2);

  assert(harness.dispatch->TryClose(child));
  assert(harness.dispatch->open_spans() == 0);

  assert(!harness.dispatch->TryClose(parent));
}

void TestRootEventIgnoresCurrentSpan() {
  Harness harness;
  auto    span_site  = MakeCallsite("request", Level::kInfo, {});
  auto    event_site = MakeCallsite("tick", Level::kError, {"message"});

  auto span = harness.dispatch->NewSpan(span_site, BuildValueSet(span_site, {}), ResolvedParent{});
  (void)span;

  std::vector<Field> fields = {{"message", StrText{"alone"}}};
  harness.dispatch->Event(event_site, BuildValueSet(event_site, fields), ResolvedParent{ParentKind::kRoot, std::nullopt});

  const auto output = harness.Output();
  assert(output.find("error app::http: src/server.rs:12: alone") != std::string::npos);
  assert(output.find("request{}") == std::string::npos);
}

void TestSpanEventsAreOptional() {
  LogDispatchOptions options;
  options.span_events = true;
  Harness harness(options);
  auto    callsite = MakeCallsite("work", Level::kInfo, {});

  auto span = harness.dispatch->NewSpan(callsite, BuildValueSet(callsite, {}), ResolvedParent{});
  harness.dispatch->Enter(span);
  harness.dispatch->Exit(span);
  harness.dispatch->TryClose(span);

  const auto output = harness.Output();
  assert(output.find("work{}: new") != std::string::npos);
  assert(output.find("work{}: enter") != std::string::npos);
  assert(output.find("work{}: exit") != std::string::npos);
  assert(output.find("work{}: close") != std::string::npos);

  Harness quiet;
  span = quiet.dispatch->NewSpan(callsite, BuildValueSet(callsite, {}), ResolvedParent{});
  quiet.dispatch->Enter(span);
  assert(quiet.Output().empty());
}

void TestInterestFilter() {
  LogDispatchOptions options;
  options.interest.max_level = Level::kInfo;
  options.interest.disabled_targets.push_back("hyper");
  Harness harness(options);

  assert(harness.dispatch->IsEnabled(MakeCallsite("a", Level::kWarn, {})));
  assert(!harness.dispatch->IsEnabled(MakeCallsite("b", Level::kDebug, {})));
  assert(!harness.dispatch->IsEnabled(MakeCallsite("c", Level::kError, {}, "hyper::proto")));
}

} // namespace

int main() {
  TestEventRendersSpanScope();
  TestRecordExtendsSpanFields();
  TestParentOutlivesChildUntilLastClose();
  TestRootEventIgnoresCurrentSpan();
  TestSpanEventsAreOptional();
  TestInterestFilter();

  std::cout << "trace_replay_unit_log_dispatch: pass\n";
  return 0;
}
