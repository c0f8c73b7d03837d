#pragma once

#include <cstddef>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "dispatchable.hpp"
#include "internal/dispatch/dispatch.hpp"
#include "internal/record/record_reader.hpp"
#include "replay_state.hpp"
#include "thread_router.hpp"

namespace tracereplay::replay {

struct ReplaySummary {
  std::size_t record_count{0};
};

/*
  Replays recorded trace activity against a live dispatch.

  The calling thread reads the recording and routes every record to the
  worker of its recorded thread. Records keep their recorded spacing: the
  offset between the first record and now is fixed on the first record
  and applied to every later one, across files.

  Usage:
      replay::Replay replay(dispatch);
      auto summary = replay.ReplayFile("app.trace");
      replay.Close();   // waits for every worker
*/
class Replay {
 public:
  explicit Replay(dispatch::DispatchPtr dispatch, ReplayOptions options = {});
  ~Replay();

  Replay(const Replay&)            = delete;
  Replay& operator=(const Replay&) = delete;

  // Throws util::ReplayFileError or util::ThreadSpawnError. Records already
  // routed keep being replayed after an error.
  ReplaySummary ReplayFile(const std::string& path);
  ReplaySummary ReplayStream(std::istream& in);

  // Waits for all queued records to be dispatched. Throws
  // util::ReplayCloseError if any worker failed. Safe to call again.
  void Close();

 private:
  ReplaySummary ReplayRecords(record::RecordReader& reader);

  // Null when the record is dropped before reaching a worker.
  std::optional<DispatchableTrace> Prepare(const record::v1::TraceRecord& record);

  bool           SpanSeen(RecordedSpanId id, std::string_view kind) const;
  RecordedParent ParentFor(bool has_parent, const record::v1::Parent& parent) const;

  util::TimePoint TargetTime(const record::v1::CaptureMeta& meta);

  std::shared_ptr<ReplayState>   state_;
  ThreadRouter                   router_;
  std::optional<util::Duration>  time_delta_;
};

} // namespace tracereplay::replay
