#include "callsite_registry.hpp"

#include <mutex>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace tracereplay::metadata {

using observability::StringField;
using observability::UintField;

// ------------------------------------------------------------
// Interning
// ------------------------------------------------------------

CallsiteHandle CallsiteRegistry::GetOrRegister(const record::v1::Metadata& metadata) {
  {
    std::shared_lock lock(mutex_);
    auto             it = by_capture_id_.find(metadata.id());
    if (it != by_capture_id_.end()) {
      const auto& existing = arena_[it->second.index].callsite;
      if (!DeclaresSameFields(existing, metadata)) {
        TRACEREPLAY_LOG_WARN("callsite redefined with a different field set, keeping the first definition",
                             {UintField("capture_id", metadata.id()), StringField("name", existing.name)});
      }
      return it->second;
    }
  }

  // Built outside the lock; a concurrent insert of the same id is settled below.
  auto callsite = CallsiteFromProto(metadata);

  std::unique_lock lock(mutex_);
  auto [it, inserted] = by_capture_id_.try_emplace(metadata.id(), CallsiteHandle{arena_.size()});
  if (inserted) {
    arena_.emplace_back(std::move(callsite));
  }
  return it->second;
}

std::optional<CallsiteHandle> CallsiteRegistry::Find(uint64_t capture_id) const {
  std::shared_lock lock(mutex_);
  auto             it = by_capture_id_.find(capture_id);
  if (it == by_capture_id_.end()) {
    return std::nullopt;
  }
  return it->second;
}

const Callsite& CallsiteRegistry::Get(CallsiteHandle handle) const {
  std::shared_lock lock(mutex_);
  if (handle.index >= arena_.size()) {
    throw std::out_of_range("unknown callsite handle " + std::to_string(handle.index));
  }
  return arena_[handle.index].callsite;
}

bool CallsiteRegistry::RegisterOnce(CallsiteHandle handle, const std::function<void(const Callsite&)>& hook) {
  // Entries never move, so the entry lock is taken without the table lock.
  auto&           entry = EntryFor(handle);
  std::lock_guard lock(entry.register_mutex);
  if (entry.registered) {
    return false;
  }
  hook(entry.callsite);
  entry.registered = true;
  return true;
}

CallsiteRegistry::Entry& CallsiteRegistry::EntryFor(CallsiteHandle handle) {
  std::shared_lock lock(mutex_);
  if (handle.index >= arena_.size()) {
    throw std::out_of_range("unknown callsite handle " + std::to_string(handle.index));
  }
  return arena_[handle.index];
}

// ------------------------------------------------------------
// Span -> callsite
// ------------------------------------------------------------

void CallsiteRegistry::BindSpan(uint64_t recorded_span_id, CallsiteHandle handle) {
  std::unique_lock lock(mutex_);
  by_span_id_[recorded_span_id] = handle;
}

std::optional<CallsiteHandle> CallsiteRegistry::CallsiteForSpan(uint64_t recorded_span_id) const {
  std::shared_lock lock(mutex_);
  auto             it = by_span_id_.find(recorded_span_id);
  if (it == by_span_id_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t CallsiteRegistry::size() const {
  std::shared_lock lock(mutex_);
  return arena_.size();
}

} // namespace tracereplay::metadata
