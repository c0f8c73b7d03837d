#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "dispatch_context.hpp"
#include "dispatchable.hpp"
#include "replay_state.hpp"
#include "work_queue.hpp"

namespace tracereplay::replay {

/*
  Replays the records of one recorded thread on one live thread.

  Items are handled strictly in submission order. Each item waits for its
  target time (when pacing), then issues its backend call. An exception
  escaping the backend ends the worker; the message is kept and reported
  by Stop().
*/
class ThreadWorker {
 public:
  ThreadWorker(std::shared_ptr<ReplayState> state, std::string thread_id, std::optional<std::string> thread_name);
  ~ThreadWorker();

  ThreadWorker(const ThreadWorker&)            = delete;
  ThreadWorker& operator=(const ThreadWorker&) = delete;

  // Throws ThreadSpawnError if the thread cannot be created.
  void Start();

  // False if the worker has already exited; the item is not queued and a
  // span it would have created is marked unavailable.
  bool Submit(WorkItem item);

  // Drains queued items, joins the thread and returns its failure, if any.
  std::optional<std::string> Stop();

  const std::string& thread_id() const {
    return thread_id_;
  }

 private:
  void Run();
  void WaitForTarget(util::TimePoint target_time) const;
  void Handle(const DispatchableTrace& trace);

  void HandleRegisterCallsite(const RegisterCallsiteTrace& trace);
  void HandleEvent(const EventTrace& trace);
  void HandleNewSpan(const NewSpanTrace& trace);
  void HandleEnter(const EnterTrace& trace);
  void HandleExit(const ExitTrace& trace);
  void HandleClose(const CloseTrace& trace);
  void HandleRecord(const RecordTrace& trace);
  void HandleFollowsFrom(const FollowsFromTrace& trace);

  // A NewSpan that will never be handled must not leave its id pending.
  void ReleaseReservation(const DispatchableTrace& trace);

  const metadata::Callsite& EnsureRegistered(metadata::CallsiteHandle handle);
  dispatch::ResolvedParent  ResolveParent(const RecordedParent& parent) const;

  std::shared_ptr<ReplayState> state_;
  std::string                  thread_id_;
  std::optional<std::string>   thread_name_;

  WorkQueue       queue_;
  DispatchContext context_;
  std::thread     thread_;

  std::mutex                 failure_mutex_;
  std::optional<std::string> failure_;
};

} // namespace tracereplay::replay
