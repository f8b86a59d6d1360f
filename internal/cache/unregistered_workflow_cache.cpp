#include "unregistered_workflow_cache.hpp"

namespace reconciler::cache {

void UnregisteredWorkflowCache::Put(const std::string& workflow_id, PendingPauseRecheck record) {
  std::lock_guard lock(mutex_);
  cache_[workflow_id] = std::move(record);
}

std::vector<PendingPauseRecheck> UnregisteredWorkflowCache::Snapshot() const {
  std::lock_guard lock(mutex_);

  std::vector<PendingPauseRecheck> records;
  records.reserve(cache_.size());
  for (const auto& [_, record] : cache_) {
    records.push_back(record);
  }
  return records;
}

void UnregisteredWorkflowCache::Remove(const std::string& workflow_id) {
  std::lock_guard lock(mutex_);
  cache_.erase(workflow_id);
}

bool UnregisteredWorkflowCache::RemoveIfUnchanged(const PendingPauseRecheck& seen) {
  std::lock_guard lock(mutex_);

  auto it = cache_.find(seen.workflow_id);
  if (it == cache_.end() || it->second.first_seen != seen.first_seen)
    return false;

  cache_.erase(it);
  return true;
}

std::size_t UnregisteredWorkflowCache::Size() const {
  std::lock_guard lock(mutex_);
  return cache_.size();
}

} // namespace reconciler::cache
