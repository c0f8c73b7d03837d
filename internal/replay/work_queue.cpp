#include "work_queue.hpp"

namespace tracereplay::replay {

bool WorkQueue::Push(WorkItem item) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || abandoned_) return false;
    queue_.push_back(std::move(item));
  }
  cv_.notify_one();
  return true;
}

std::optional<WorkItem> WorkQueue::Pop() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || abandoned_ || !queue_.empty(); });

  if (abandoned_ || (shutdown_ && queue_.empty())) return std::nullopt;

  WorkItem item = std::move(queue_.front());
  queue_.pop_front();
  return item;
}

void WorkQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::deque<WorkItem> WorkQueue::Abandon() {
  std::deque<WorkItem> discarded;
  {
    std::lock_guard lock(mutex_);
    abandoned_ = true;
    discarded.swap(queue_);
  }
  cv_.notify_all();
  return discarded;
}

} // namespace tracereplay::replay
