#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "dispatchable.hpp"
#include "internal/util/errors.hpp"
#include "replay_state.hpp"
#include "thread_worker.hpp"

namespace tracereplay::replay {

/*
  Routes work items to one worker per recorded thread.

  Workers are spawned lazily on the first item for a thread id and live
  until Close(). Only the coordinator thread calls into the router.
*/
class ThreadRouter {
 public:
  // Builds the worker for a newly seen thread id; the router starts it.
  using WorkerFactory =
      std::function<std::unique_ptr<ThreadWorker>(std::shared_ptr<ReplayState>, const std::string&, const std::optional<std::string>&)>;

  explicit ThreadRouter(std::shared_ptr<ReplayState> state, WorkerFactory factory = {});
  ~ThreadRouter();

  ThreadRouter(const ThreadRouter&)            = delete;
  ThreadRouter& operator=(const ThreadRouter&) = delete;

  // Throws ThreadSpawnError; a span the item would have created is marked
  // unavailable first. An item for a worker that already exited is logged
  // and dropped.
  void Route(const std::string& thread_id, const std::optional<std::string>& thread_name, WorkItem item);

  // Stops every worker, in thread id order, and returns their failures.
  std::vector<util::ReplayCloseError::Failure> Close();

  std::size_t worker_count() const {
    return workers_.size();
  }

 private:
  ThreadWorker& WorkerFor(const std::string& thread_id, const std::optional<std::string>& thread_name);

  std::shared_ptr<ReplayState>                         state_;
  WorkerFactory                                        factory_;
  std::map<std::string, std::unique_ptr<ThreadWorker>> workers_;
};

} // namespace tracereplay::replay
