#include "internal/replay/replay.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "internal/record/record_writer.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/record_builders.hpp"
#include "tests/support/recording_dispatch.hpp"

namespace {

using tracereplay::dispatch::ParentKind;
using tracereplay::replay::Replay;
using tracereplay::replay::ReplayOptions;
using tracereplay::testing::Close;
using tracereplay::testing::Enter;
using tracereplay::testing::Event;
using tracereplay::testing::Exit;
using tracereplay::testing::FollowsFrom;
using tracereplay::testing::MakeMetadata;
using tracereplay::testing::MakeRecord;
using tracereplay::testing::NewSpan;
using tracereplay::testing::ParentSpec;
using tracereplay::testing::RecordingDispatch;
using tracereplay::testing::RecordValues;
using tracereplay::testing::RegisterCallsite;
using tracereplay::util::ReplayCloseError;
using tracereplay::util::ReplayFileError;
namespace v1 = tracereplay::record::v1;

std::string Serialize(const std::vector<v1::TraceRecord>& records) {
  std::ostringstream              out;
  tracereplay::record::RecordWriter writer(out);
  for (const auto& record : records) {
    writer.Write(record);
  }
  return out.str();
}

std::size_t RunReplay(const std::vector<v1::TraceRecord>& records, const std::shared_ptr<RecordingDispatch>& dispatch) {
  std::istringstream in(Serialize(records));
  Replay             replay(dispatch, ReplayOptions{false});
  auto               summary = replay.ReplayStream(in);
  replay.Close();
  return summary.record_count;
}

v1::Metadata RequestSpan() {
  return MakeMetadata(1, "request", v1::KIND_SPAN, {"path"});
}

v1::Metadata HandledEvent() {
  return MakeMetadata(2, "handled", v1::KIND_EVENT, {"message", "status"});
}

v1::Metadata QuerySpan() {
  return MakeMetadata(3, "query", v1::KIND_SPAN, {"table", "rows"});
}

void TestSingleThreadSpanLifecycle() {
  auto dispatch = std::make_shared<RecordingDispatch>();

  const auto count = RunReplay(
      {
          RegisterCallsite("1", RequestSpan()),
          NewSpan("1", 10, RequestSpan(), {{"path", "/index"}}, ParentSpec::Root()),
          Enter("1", 10),
          Event("1", HandledEvent(), {{"message", "done"}, {"status", "200"}}),
          Exit("1", 10),
          Close("1", 10),
      },
      dispatch);

  assert(count == 6);
  assert(dispatch->CountOf("register", "request") == 1);
  assert(dispatch->CountOf("register", "handled") == 1);

  auto live = dispatch->SpanNamed("request");
  assert(live.has_value());

  auto spans = dispatch->CallsOf("new_span");
  assert(spans.size() == 1);
  assert(spans[0].parent_kind == ParentKind::kRoot);
  assert(spans[0].fields.size() == 1 && spans[0].fields[0].second == "/index");

  auto events = dispatch->CallsOf("event");
  assert(events.size() == 1);
  assert(events[0].parent_kind == ParentKind::kCurrent);
  assert(events[0].parent == live);
  assert(events[0].fields.size() == 2);

  assert(dispatch->CallsOf("enter").at(0).span == *live);
  assert(dispatch->CallsOf("exit").at(0).span == *live);
  assert(dispatch->CallsOf("close").at(0).span == *live);
}

void TestCallsiteRegisteredOnceAndBeforeUse() {
  auto dispatch = std::make_shared<RecordingDispatch>();

  // The recording starts mid-stream: no RegisterCallsite for "handled".
  RunReplay(
      {
          Event("1", HandledEvent(), {{"message", "first"}}),
          RegisterCallsite("1", HandledEvent()),
          RegisterCallsite("2", HandledEvent()),
          Event("2", HandledEvent(), {{"message", "second"}}),
      },
      dispatch);

  assert(dispatch->CountOf("register", "handled") == 1);
  assert(dispatch->CountOf("event", "handled") == 2);

  auto calls = dispatch->calls();
  assert(calls.front().op == "register");
}

void TestNestedSpansUseCurrentParent() {
  auto dispatch = std::make_shared<RecordingDispatch>();

  RunReplay(
      {
          NewSpan("1", 1, RequestSpan()),
          Enter("1", 1),
          NewSpan("1", 2, QuerySpan(), {{"table", "users"}}),
          Enter("1", 2),
          Event("1", HandledEvent(), {{"message", "inner"}}),
          Exit("1", 2),
          Event("1", HandledEvent(), {{"message", "outer"}}),
          Exit("1", 1),
          Event("1", HandledEvent(), {{"message", "none"}}),
      },
      dispatch);

  const auto outer = dispatch->SpanNamed("request");
  const auto inner = dispatch->SpanNamed("query");
  assert(outer && inner);

  auto spans = dispatch->CallsOf("new_span");
  assert(spans[0].parent == std::nullopt);
  assert(spans[1].parent == outer);

  auto events = dispatch->CallsOf("event");
  assert(events.size() == 3);
  assert(events[0].parent == inner);
  assert(events[1].parent == outer);
  assert(events[2].parent == std::nullopt);
}

void TestSpanCreatedOnOneThreadUsedOnAnother() {
  auto dispatch = std::make_shared<RecordingDispatch>();

  RunReplay(
      {
          NewSpan("a", 7, RequestSpan()),
          Enter("b", 7),
          Event("b", HandledEvent(), {{"message", "remote"}}),
          Exit("b", 7),
          Event("c", HandledEvent(), {{"message", "explicit"}}, ParentSpec::Explicit(7)),
          Close("b", 7),
      },
      dispatch);

  const auto live = dispatch->SpanNamed("request");
  assert(live);

  auto events = dispatch->CallsOf("event");
  assert(events.size() == 2);
  for (const auto& event : events) {
    assert(event.parent == live);
  }
  assert(dispatch->CallsOf("close").at(0).span == *live);
}

void TestRecordFiltersFieldsAndDropsUnknownSpans() {
  auto dispatch = std::make_shared<RecordingDispatch>();

  const auto count = RunReplay(
      {
          NewSpan("1", 3, QuerySpan(), {{"table", "orders"}}),
          RecordValues("1", 3, {{"rows", "12"}, {"undeclared", "x"}}),
          RecordValues("1", 99, {{"rows", "1"}}),
      },
      dispatch);

  assert(count == 3);

  auto records = dispatch->CallsOf("record");
  assert(records.size() == 1);
  assert(records[0].span == *dispatch->SpanNamed("query"));
  assert(records[0].fields.size() == 1);
  assert(records[0].fields[0].first == "rows");
  assert(records[0].fields[0].second == "12");
}

void TestDisabledSpanReleasesWaiters() {
  auto dispatch = std::make_shared<RecordingDispatch>();
  dispatch->disabled.insert("request");

  RunReplay(
      {
          NewSpan("1", 5, RequestSpan()),
          Enter("2", 5),
          Event("2", HandledEvent(), {{"message", "orphan"}}, ParentSpec::Explicit(5)),
          Exit("2", 5),
          Close("1", 5),
      },
      dispatch);

  assert(dispatch->CountOf("new_span") == 0);
  assert(dispatch->CountOf("enter") == 0);
  assert(dispatch->CountOf("close") == 0);

  auto events = dispatch->CallsOf("event");
  assert(events.size() == 1);
  assert(events[0].parent_kind == ParentKind::kCurrent);
  assert(events[0].parent == std::nullopt);
}

void TestRootParentAndFollowsFrom() {
  auto dispatch = std::make_shared<RecordingDispatch>();

  RunReplay(
      {
          NewSpan("1", 1, RequestSpan()),
          NewSpan("1", 2, QuerySpan()),
          Enter("1", 1),
          Event("1", HandledEvent(), {{"message", "detached"}}, ParentSpec::Root()),
          Exit("1", 1),
          FollowsFrom("1", 1, 2),
      },
      dispatch);

  auto events = dispatch->CallsOf("event");
  assert(events.size() == 1);
  assert(events[0].parent_kind == ParentKind::kRoot);
  assert(events[0].parent == std::nullopt);

  auto links = dispatch->CallsOf("follows_from");
  assert(links.size() == 1);
  assert(links[0].span == *dispatch->SpanNamed("query"));
  assert(links[0].cause == *dispatch->SpanNamed("request"));
}

v1::TraceRecord At(v1::TraceRecord record, uint64_t offset_ms) {
  *record.mutable_meta() = MakeRecord(record.meta().thread_id(), offset_ms).meta();
  return record;
}

void TestForwardSpanReferencesDoNotBlock() {
  auto dispatch = std::make_shared<RecordingDispatch>();

  // Span 2 is named before it is created, on the thread that creates it.
  std::istringstream in(Serialize({
      At(Event("a", HandledEvent(), {{"message", "lead"}}), 0),
      At(NewSpan("a", 1, RequestSpan(), {}, ParentSpec::Explicit(2)), 50),
      At(Enter("a", 2), 100),
      At(NewSpan("a", 2, QuerySpan(), {}, ParentSpec::Root()), 150),
      At(Close("a", 2), 150),
  }));

  Replay replay(dispatch, ReplayOptions{true});
  auto   summary = replay.ReplayStream(in);
  replay.Close();
  assert(summary.record_count == 5);

  auto spans = dispatch->CallsOf("new_span");
  assert(spans.size() == 2);
  assert(spans[0].name == "request");
  assert(spans[0].parent_kind == ParentKind::kCurrent);
  assert(spans[0].parent == std::nullopt);
  assert(spans[1].name == "query");

  assert(dispatch->CountOf("enter") == 0);
  auto closes = dispatch->CallsOf("close");
  assert(closes.size() == 1);
  assert(closes[0].span == *dispatch->SpanNamed("query"));
}

void TestFollowsFromWithUnknownSpansIsSkipped() {
  auto dispatch = std::make_shared<RecordingDispatch>();

  const auto count = RunReplay(
      {
          NewSpan("1", 1, RequestSpan()),
          FollowsFrom("1", 42, 1),
          FollowsFrom("1", 1, 43),
          Event("1", HandledEvent(), {{"message", "same thread"}}),
          Event("2", HandledEvent(), {{"message", "other thread"}}),
      },
      dispatch);

  assert(count == 5);
  assert(dispatch->CountOf("follows_from") == 0);
  assert(dispatch->CountOf("new_span") == 1);
  assert(dispatch->CountOf("event") == 2);
}

void TestCloseReportsWorkerFailures() {
  auto dispatch            = std::make_shared<RecordingDispatch>();
  dispatch->throw_on_event = "boom";
  const auto boom          = MakeMetadata(9, "boom", v1::KIND_EVENT);

  std::istringstream in(Serialize({
      Event("t1", boom),
      Event("t1", HandledEvent(), {{"message", "after failure"}}),
      Event("t2", HandledEvent(), {{"message", "unaffected"}}),
  }));

  Replay replay(dispatch, ReplayOptions{false});
  auto   summary = replay.ReplayStream(in);
  assert(summary.record_count == 3);

  bool threw = false;
  try {
    replay.Close();
  } catch (const ReplayCloseError& e) {
    threw = true;
    assert(e.failures().size() == 1);
    assert(e.failures()[0].first == "t1");
    assert(e.failures()[0].second.find("boom") != std::string::npos);
    assert(std::string(e.what()).find("t1") != std::string::npos);
  }
  assert(threw);

  auto events = dispatch->CallsOf("event");
  assert(events.size() == 1);
  assert(events[0].fields.at(0).second == "unaffected");

  // Workers are gone, closing again has nothing to report.
  replay.Close();
}

void TestMissingFileReportsOpenError() {
  auto   dispatch = std::make_shared<RecordingDispatch>();
  Replay replay(dispatch, ReplayOptions{false});

  bool threw = false;
  try {
    replay.ReplayFile("/nonexistent/recording.trace");
  } catch (const ReplayFileError& e) {
    threw = true;
    assert(e.kind() == ReplayFileError::Kind::kCannotOpenFile);
  }
  assert(threw);
}

void TestMalformedLineStopsReplayAfterEarlierRecords() {
  auto dispatch = std::make_shared<RecordingDispatch>();

  const auto path = std::filesystem::temp_directory_path() / "tracereplay_malformed.trace";
  {
    std::ofstream out(path);
    out << Serialize({Event("1", HandledEvent(), {{"message", "kept"}})});
    out << "{\"meta\": not json}\n";
    out << Serialize({Event("1", HandledEvent(), {{"message", "never"}})});
  }

  Replay replay(dispatch, ReplayOptions{false});
  bool   threw = false;
  try {
    replay.ReplayFile(path.string());
  } catch (const ReplayFileError& e) {
    threw = true;
    assert(e.kind() == ReplayFileError::Kind::kCannotDeserializeRecord);
    assert(e.line_index() == 1);
    assert(e.line() == "{\"meta\": not json}");
  }
  assert(threw);
  replay.Close();

  auto events = dispatch->CallsOf("event");
  assert(events.size() == 1);
  assert(events[0].fields.at(0).second == "kept");

  std::filesystem::remove(path);
}

void TestPacingKeepsRecordedSpacing() {
  auto dispatch = std::make_shared<RecordingDispatch>();

  auto first  = Event("1", HandledEvent(), {{"message", "first"}});
  auto second = Event("1", HandledEvent(), {{"message", "second"}});
  *second.mutable_meta() = MakeRecord("1", 200).meta();

  std::istringstream in(Serialize({first, second}));

  const auto start = std::chrono::steady_clock::now();
  Replay     replay(dispatch, ReplayOptions{true});
  replay.ReplayStream(in);
  replay.Close();
  const auto elapsed = std::chrono::steady_clock::now() - start;

  assert(dispatch->CountOf("event") == 2);
  assert(elapsed >= std::chrono::milliseconds(190));
}

} // namespace

int main() {
  TestSingleThreadSpanLifecycle();
  TestCallsiteRegisteredOnceAndBeforeUse();
  TestNestedSpansUseCurrentParent();
  TestSpanCreatedOnOneThreadUsedOnAnother();
  TestRecordFiltersFieldsAndDropsUnknownSpans();
  TestDisabledSpanReleasesWaiters();
  TestRootParentAndFollowsFrom();
  TestForwardSpanReferencesDoNotBlock();
  TestFollowsFromWithUnknownSpansIsSkipped();
  TestCloseReportsWorkerFailures();
  TestMissingFileReportsOpenError();
  TestMalformedLineStopsReplayAfterEarlierRecords();
  TestPacingKeepsRecordedSpacing();

  std::cout << "replay_test: pass\n";
  return 0;
}
