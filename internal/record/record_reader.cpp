#include "record_reader.hpp"

#include <google/protobuf/util/json_util.h>

#include <cerrno>
#include <cstring>

#include "field_value.hpp"
#include "internal/util/errors.hpp"

namespace tracereplay::record {

using util::MalformedRecord;
using util::ReplayFileError;

namespace {

void ValidateMetadata(const v1::Metadata& metadata) {
  if (metadata.level() == v1::LEVEL_UNSPECIFIED) {
    throw MalformedRecord("metadata " + std::to_string(metadata.id()) + " has no level");
  }
  if (metadata.kind() == v1::KIND_UNSPECIFIED) {
    throw MalformedRecord("metadata " + std::to_string(metadata.id()) + " has no kind");
  }
}

} // namespace

RecordReader::RecordReader(const std::string& path) : file_(path), in_(&file_) {
  if (!file_.is_open()) {
    throw ReplayFileError(ReplayFileError::Kind::kCannotOpenFile, "cannot open recording '" + path + "': " + std::strerror(errno));
  }
}

RecordReader::RecordReader(std::istream& in) : in_(&in) {
}

bool RecordReader::Next(v1::TraceRecord* record) {
  std::string line;
  if (!std::getline(*in_, line)) {
    if (in_->bad()) {
      throw ReplayFileError(ReplayFileError::Kind::kCannotReadLine, "cannot read line " + std::to_string(next_index_), next_index_);
    }
    return false;
  }

  line_index_ = next_index_++;
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  try {
    *record = ParseRecordLine(line);
  } catch (const MalformedRecord& e) {
    throw ReplayFileError(ReplayFileError::Kind::kCannotDeserializeRecord,
                          "cannot deserialize record at line " + std::to_string(line_index_) + ": " + e.what(), line_index_, line);
  }
  return true;
}

v1::TraceRecord ParseRecordLine(std::string_view line) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  v1::TraceRecord record;
  auto status = google::protobuf::util::JsonStringToMessage(std::string(line), &record, options);
  if (!status.ok()) {
    throw MalformedRecord(std::string(status.message()));
  }

  ValidateRecord(record);
  return record;
}

void ValidateRecord(const v1::TraceRecord& record) {
  if (!record.has_meta()) {
    throw MalformedRecord("record has no meta");
  }
  if (record.meta().thread_id().empty()) {
    throw MalformedRecord("record has no thread_id");
  }
  if (record.meta().timestamp_subsec_us() >= 1000000) {
    throw MalformedRecord("timestamp_subsec_us out of range: " + std::to_string(record.meta().timestamp_subsec_us()));
  }

  switch (record.trace_case()) {
    case v1::TraceRecord::kRegisterCallsite:
      ValidateMetadata(record.register_callsite());
      break;
    case v1::TraceRecord::kEvent:
      if (!record.event().has_metadata()) {
        throw MalformedRecord("event has no metadata");
      }
      ValidateMetadata(record.event().metadata());
      ValidateFields(record.event().fields());
      break;
    case v1::TraceRecord::kNewSpan:
      if (!record.new_span().has_metadata()) {
        throw MalformedRecord("new_span has no metadata");
      }
      ValidateMetadata(record.new_span().metadata());
      ValidateFields(record.new_span().fields());
      break;
    case v1::TraceRecord::kRecordValues:
      ValidateFields(record.record_values().fields());
      break;
    case v1::TraceRecord::kEnter:
    case v1::TraceRecord::kExit:
    case v1::TraceRecord::kClose:
    case v1::TraceRecord::kFollowsFrom:
      break;
    case v1::TraceRecord::TRACE_NOT_SET:
      throw MalformedRecord("record has no trace payload");
  }
}

} // namespace tracereplay::record
