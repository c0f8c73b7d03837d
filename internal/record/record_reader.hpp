#pragma once

#include <cstddef>
#include <fstream>
#include <istream>
#include <string>
#include <string_view>

#include "tracereplay/record/v1/record.pb.h"

namespace tracereplay::record {

/*
  Sequential reader over a recording.

  A recording is newline-delimited; every line is one TraceRecord in the
  protobuf JSON mapping. Lines are returned strictly in file order.

  Errors are reported as util::ReplayFileError:
    kCannotOpenFile          — constructor, path could not be opened
    kCannotReadLine          — Next(), the stream failed mid-file
    kCannotDeserializeRecord — Next(), the line is not a valid record
*/
class RecordReader {
 public:
  explicit RecordReader(const std::string& path);
  explicit RecordReader(std::istream& in);

  RecordReader(const RecordReader&)            = delete;
  RecordReader& operator=(const RecordReader&) = delete;

  // Returns false at end of input.
  bool Next(v1::TraceRecord* record);

  // Index of the line most recently returned by Next().
  std::size_t line_index() const {
    return line_index_;
  }

 private:
  std::ifstream file_;
  std::istream* in_;
  std::size_t   next_index_{0};
  std::size_t   line_index_{0};
};

// Throws util::MalformedRecord.
v1::TraceRecord ParseRecordLine(std::string_view line);

// Structural checks the JSON mapping cannot express. Throws util::MalformedRecord.
void ValidateRecord(const v1::TraceRecord& record);

} // namespace tracereplay::record
