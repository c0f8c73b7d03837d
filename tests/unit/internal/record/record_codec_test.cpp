#include "internal/record/record_reader.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/record/record_writer.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/record_builders.hpp"

namespace {

using tracereplay::record::ParseRecordLine;
using tracereplay::record::RecordReader;
using tracereplay::record::RecordWriter;
using tracereplay::record::SerializeRecordLine;
using tracereplay::util::MalformedRecord;
using tracereplay::util::ReplayFileError;
namespace v1 = tracereplay::record::v1;

template <typename Fn>
bool ThrowsMalformed(Fn&& fn) {
  try {
    fn();
  } catch (const MalformedRecord&) {
    return true;
  }
  return false;
}

void TestParsesHandWrittenLine() {
  auto record = ParseRecordLine(
      R"json({"meta":{"timestamp_s":"1700000000","timestamp_subsec_us":250,"thread_id":"ThreadId(3)","thread_name":"tokio-runtime-worker"},)json"
      R"json("enter":{"id":"18446744073709551615"}})json");

  assert(record.meta().timestamp_s() == 1700000000u);
  assert(record.meta().timestamp_subsec_us() == 250u);
  assert(record.meta().thread_name() == "tokio-runtime-worker");
  assert(record.trace_case() == v1::TraceRecord::kEnter);
  assert(record.enter().id() == 18446744073709551615ull);
}

void TestSerializedLineIsSingleLineAndParsesBack() {
  auto original = tracereplay::testing::NewSpan("1", 42, tracereplay::testing::MakeMetadata(5, "db.query", v1::KIND_SPAN, {"sql"}),
                                                {{"sql", "select 1\nfrom dual"}}, tracereplay::testing::ParentSpec::Explicit(7));

  const auto line = SerializeRecordLine(original);
  assert(line.find('\n') == std::string::npos);

  auto parsed = ParseRecordLine(line);
  assert(parsed.new_span().id() == 42u);
  assert(parsed.new_span().parent().explicit_span_id() == 7u);
  assert(parsed.new_span().fields(0).value().str() == "select 1\nfrom dual");
}

void TestStructuralChecks() {
  // no meta
  assert(ThrowsMalformed([] { ParseRecordLine(R"({"enter":{"id":"1"}})"); }));
  // empty thread id
  assert(ThrowsMalformed([] { ParseRecordLine(R"({"meta":{"timestamp_s":"1","thread_id":""},"enter":{"id":"1"}})"); }));
  // no payload
  assert(ThrowsMalformed([] { ParseRecordLine(R"({"meta":{"timestamp_s":"1","thread_id":"1"}})"); }));
  // sub-second part out of range
  assert(ThrowsMalformed(
      [] { ParseRecordLine(R"({"meta":{"timestamp_s":"1","timestamp_subsec_us":1000000,"thread_id":"1"},"enter":{"id":"1"}})"); }));
  // unknown key
  assert(ThrowsMalformed([] { ParseRecordLine(R"({"meta":{"thread_id":"1"},"enter":{"id":"1"},"extra":true})"); }));
  // event without level
  assert(ThrowsMalformed([] {
    ParseRecordLine(R"({"meta":{"thread_id":"1"},"event":{"metadata":{"id":"1","name":"e","kind":"KIND_EVENT"}}})");
  }));
  // field without value
  assert(ThrowsMalformed([] {
    ParseRecordLine(R"({"meta":{"thread_id":"1"},"record_values":{"id":"1","fields":[{"name":"x"}]}})");
  }));
}

void TestReaderTracksLineIndexAndStripsCarriageReturn() {
  std::ostringstream out;
  RecordWriter       writer(out);
  writer.Write(tracereplay::testing::Enter("1", 1));
  writer.Write(tracereplay::testing::Exit("1", 1));

  std::string text = out.str();
  text.insert(text.find('\n'), "\r");

  std::istringstream in(text);
  RecordReader       reader(in);
  v1::TraceRecord    record;

  assert(reader.Next(&record));
  assert(reader.line_index() == 0);
  assert(record.trace_case() == v1::TraceRecord::kEnter);

  assert(reader.Next(&record));
  assert(reader.line_index() == 1);
  assert(record.trace_case() == v1::TraceRecord::kExit);

  assert(!reader.Next(&record));
}

void TestReaderReportsBadLine() {
  std::istringstream in(SerializeRecordLine(tracereplay::testing::Close("1", 1)) + "\n\n");
  RecordReader       reader(in);
  v1::TraceRecord    record;
  assert(reader.Next(&record));

  bool threw = false;
  try {
    reader.Next(&record);
  } catch (const ReplayFileError& e) {
    threw = true;
    assert(e.kind() == ReplayFileError::Kind::kCannotDeserializeRecord);
    assert(e.line_index() == 1);
    assert(e.line().empty());
  }
  assert(threw);
}

void TestReaderReportsMissingFile() {
  bool threw = false;
  try {
    RecordReader reader(std::string("/nonexistent/dir/app.trace"));
  } catch (const ReplayFileError& e) {
    threw = true;
    assert(e.kind() == ReplayFileError::Kind::kCannotOpenFile);
    assert(std::string(e.what()).find("/nonexistent/dir/app.trace") != std::string::npos);
  }
  assert(threw);
}

} // namespace

int main() {
  TestParsesHandWrittenLine();
  TestSerializedLineIsSingleLineAndParsesBack();
  TestStructuralChecks();
  TestReaderTracksLineIndexAndStripsCarriageReturn();
  TestReaderReportsBadLine();
  TestReaderReportsMissingFile();

  std::cout << "trace_replay_unit_record_codec: pass\n";
  return 0;
}
