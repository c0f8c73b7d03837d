#pragma once

#include <mutex>
#include <ostream>
#include <string>

#include "tracereplay/record/v1/record.pb.h"

namespace tracereplay::record {

// Single-line JSON encoding of a record, without the trailing newline.
std::string SerializeRecordLine(const v1::TraceRecord& record);

/*
  Appends records to a stream, one per line. Safe to share between threads.
*/
class RecordWriter {
 public:
  explicit RecordWriter(std::ostream& out) : out_(out) {
  }

  void Write(const v1::TraceRecord& record);

 private:
  std::mutex    mutex_;
  std::ostream& out_;
};

} // namespace tracereplay::record
