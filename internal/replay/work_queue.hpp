#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "dispatchable.hpp"

namespace tracereplay::replay {

/*
  Unbounded FIFO feeding one replay worker.

  Shutdown() is the end marker: items pushed before it are still handed
  out, then Pop() returns nullopt. Abandon() is used by a worker that died:
  pending items are discarded and later pushes are refused.
*/
class WorkQueue {
 public:
  // False once the queue has been shut down or abandoned.
  bool Push(WorkItem item);

  // blocking wait
  std::optional<WorkItem> Pop();

  void Shutdown();

  // Returns the items that were still queued.
  std::deque<WorkItem> Abandon();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::deque<WorkItem>    queue_;
  bool                    shutdown_  = false;
  bool                    abandoned_ = false;
};

} // namespace tracereplay::replay
