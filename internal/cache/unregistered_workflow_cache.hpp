#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/util/time.hpp"

namespace reconciler::cache {

/*
  A workflow whose file was written but which the scheduler has not
  registered yet. The paused flag is applied once it shows up.
*/
struct PendingPauseRecheck {
  std::string workflow_id;
  std::string written_path;
  std::string name_space;
  std::string name;
  bool        paused = false;

  // version of the task that parked the entry
  std::int64_t version = 0;

  util::TimePoint first_seen{};
};

/*
  Concurrent workflow_id -> PendingPauseRecheck map.

  Reconciler workers only Put. The recheck worker snapshots and removes.
*/
class UnregisteredWorkflowCache {
 public:
  void Put(const std::string& workflow_id, PendingPauseRecheck record);

  std::vector<PendingPauseRecheck> Snapshot() const;

  void Remove(const std::string& workflow_id);

  // Removes the entry only if it was not re-queued since `seen` was taken.
  bool RemoveIfUnchanged(const PendingPauseRecheck& seen);

  std::size_t Size() const;

 private:
  mutable std::mutex                                   mutex_;
  std::unordered_map<std::string, PendingPauseRecheck> cache_;
};

} // namespace reconciler::cache
