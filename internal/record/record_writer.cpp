#include "record_writer.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace tracereplay::record {

std::string SerializeRecordLine(const v1::TraceRecord& record) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = false;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = false;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(record, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize record: " + std::string(status.message()));
  }
  return json;
}

void RecordWriter::Write(const v1::TraceRecord& record) {
  auto line = SerializeRecordLine(record);

  std::lock_guard lock(mutex_);
  out_ << line << '\n';
  if (!out_) {
    throw std::runtime_error("Failed to write record");
  }
}

} // namespace tracereplay::record
