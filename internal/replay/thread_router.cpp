#include "thread_router.hpp"

#include <utility>
#include <variant>

#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"

namespace tracereplay::replay {

using observability::StringField;

namespace {

std::unique_ptr<ThreadWorker> MakeThreadWorker(std::shared_ptr<ReplayState> state, const std::string& thread_id,
                                               const std::optional<std::string>& thread_name) {
  return std::make_unique<ThreadWorker>(std::move(state), thread_id, thread_name);
}

} // namespace

ThreadRouter::ThreadRouter(std::shared_ptr<ReplayState> state, WorkerFactory factory)
    : state_(std::move(state)), factory_(factory ? std::move(factory) : WorkerFactory(MakeThreadWorker)) {
}

ThreadRouter::~ThreadRouter() {
  for (const auto& [thread_id, error] : Close()) {
    TRACEREPLAY_LOG_ERROR("replay worker failed", {StringField("thread_id", thread_id), StringField("error", error)});
  }
}

void ThreadRouter::Route(const std::string& thread_id, const std::optional<std::string>& thread_name, WorkItem item) {
  ThreadWorker* worker = nullptr;
  try {
    worker = &WorkerFor(thread_id, thread_name);
  } catch (const util::ThreadSpawnError&) {
    // Workers blocked on this span would otherwise keep Close() waiting.
    if (const auto* new_span = std::get_if<NewSpanTrace>(&item.trace)) {
      state_->span_ids.MarkUnavailable(new_span->id);
    }
    throw;
  }

  const auto kind = TraceKindName(item.trace);
  if (!worker->Submit(std::move(item))) {
    TRACEREPLAY_LOG_WARN("replay worker has exited, dropping record", {StringField("thread_id", thread_id), StringField("kind", kind)});
    observability::Metrics::Instance().RecordDropped("worker_exited");
  }
}

std::vector<util::ReplayCloseError::Failure> ThreadRouter::Close() {
  std::vector<util::ReplayCloseError::Failure> failures;
  for (auto& [thread_id, worker] : workers_) {
    if (auto failure = worker->Stop()) {
      failures.emplace_back(thread_id, std::move(*failure));
    }
  }
  workers_.clear();
  observability::Metrics::Instance().SetWorkerCount(0);
  return failures;
}

ThreadWorker& ThreadRouter::WorkerFor(const std::string& thread_id, const std::optional<std::string>& thread_name) {
  auto it = workers_.find(thread_id);
  if (it != workers_.end()) {
    return *it->second;
  }

  auto worker = factory_(state_, thread_id, thread_name);
  worker->Start();

  TRACEREPLAY_LOG_DEBUG("spawned replay worker", {StringField("thread_id", thread_id), StringField("thread_name", thread_name.value_or(""))});
  auto& ref = *worker;
  workers_.emplace(thread_id, std::move(worker));
  observability::Metrics::Instance().SetWorkerCount(workers_.size());
  return ref;
}

} // namespace tracereplay::replay
