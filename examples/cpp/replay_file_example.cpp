#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/dispatch/dispatch_factory.hpp"
#include "internal/record/record_writer.hpp"
#include "internal/replay/replay.hpp"
#include "internal/util/time.hpp"

namespace {

namespace v1 = tracereplay::record::v1;

v1::TraceRecord Stamped(const std::string& thread_id, uint64_t offset_ms) {
  const auto now = tracereplay::util::ToUnixMicros(tracereplay::util::Now()) + offset_ms * 1000;

  v1::TraceRecord record;
  auto*           meta = record.mutable_meta();
  meta->set_timestamp_s(now / 1000000);
  meta->set_timestamp_subsec_us(static_cast<uint32_t>(now % 1000000));
  meta->set_thread_id(thread_id);
  meta->set_thread_name("example-" + thread_id);
  return record;
}

v1::Metadata Callsite(uint64_t id, const std::string& name, v1::Kind kind, std::initializer_list<const char*> fields) {
  v1::Metadata metadata;
  metadata.set_id(id);
  metadata.set_name(name);
  metadata.set_target("example::checkout");
  metadata.set_level(v1::LEVEL_INFO);
  metadata.set_kind(kind);
  metadata.set_file("examples/checkout.rs");
  metadata.set_line(static_cast<uint32_t>(id * 10));
  for (const char* field : fields) {
    metadata.add_fields(field);
  }
  return metadata;
}

void AddStr(google::protobuf::RepeatedPtrField<v1::Field>* fields, const std::string& name, const std::string& value) {
  auto* field = fields->Add();
  field->set_name(name);
  field->mutable_value()->set_str(value);
}

// A request span opened on one thread and finished on another, 100ms apart.
void WriteRecording(const std::filesystem::path& path) {
  std::ofstream                     out(path);
  tracereplay::record::RecordWriter writer(out);

  const auto order   = Callsite(1, "order", v1::KIND_SPAN, {"order_id"});
  const auto charged = Callsite(2, "charged", v1::KIND_EVENT, {"message", "amount"});

  auto span = Stamped("1", 0);
  span.mutable_new_span()->set_id(1);
  *span.mutable_new_span()->mutable_metadata() = order;
  AddStr(span.mutable_new_span()->mutable_fields(), "order_id", "A-1001");
  writer.Write(span);

  auto enter = Stamped("2", 100);
  enter.mutable_enter()->set_id(1);
  writer.Write(enter);

  auto event = Stamped("2", 110);
  *event.mutable_event()->mutable_metadata() = charged;
  AddStr(event.mutable_event()->mutable_fields(), "message", "card charged");
  event.mutable_event()->add_fields()->set_name("amount");
  event.mutable_event()->mutable_fields(1)->mutable_value()->set_f64(42.5);
  writer.Write(event);

  auto exit = Stamped("2", 120);
  exit.mutable_exit()->set_id(1);
  writer.Write(exit);

  auto close = Stamped("2", 130);
  close.mutable_close()->set_id(1);
  writer.Write(close);
}

} // namespace

int main(int argc, char** argv) {
  const std::filesystem::path path = argc > 1 ? argv[1] : std::filesystem::temp_directory_path() / "checkout.trace";

  try {
    WriteRecording(path);

    tracereplay::runtime::config::DispatchConfig dispatch_config;
    dispatch_config.mutable_log()->set_span_events(true);

    tracereplay::replay::Replay replay(tracereplay::dispatch::DispatchFactory::Build(dispatch_config));
    auto                        summary = replay.ReplayFile(path.string());
    replay.Close();

    std::cout << "Replayed " << summary.record_count << " records from " << path << '\n';
  } catch (const std::exception& e) {
    std::cerr << "Replay failed: " << e.what() << '\n';
    return 1;
  }
  return 0;
}
