#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/util/time.hpp"

namespace reconciler::cache {
class UnregisteredWorkflowCache;
}
namespace reconciler::core {
class Reconciler;
}

namespace reconciler::recheck {

struct SweepStats {
  std::size_t applied      = 0;
  std::size_t import_error = 0;
  std::size_t expired      = 0;
  std::size_t pending      = 0;
  std::size_t failed       = 0;
  std::size_t superseded   = 0;
};

/*
  Periodically drains the UnregisteredWorkflowCache.

  Each entry is rechecked against the metadata store: once the scheduler
  registers the workflow its paused flag is converged and the entry
  dropped. Entries whose file failed to import, that a newer accepted task
  superseded, or that stay unregistered past max_age, are dropped as well.

  Rechecks go through Reconciler::RecheckPause so they serialize with task
  handling for the same name.
*/
class PauseRecheckWorker {
 public:
  PauseRecheckWorker(std::shared_ptr<cache::UnregisteredWorkflowCache> unregistered,
                     std::shared_ptr<core::Reconciler> reconciler, std::chrono::milliseconds interval,
                     std::chrono::milliseconds max_age);
  ~PauseRecheckWorker();

  PauseRecheckWorker(const PauseRecheckWorker&)            = delete;
  PauseRecheckWorker& operator=(const PauseRecheckWorker&) = delete;

  void Start();
  void Stop();

  SweepStats Sweep(util::TimePoint now);

 private:
  void Run();

  std::shared_ptr<cache::UnregisteredWorkflowCache> unregistered_;
  std::shared_ptr<core::Reconciler>                 reconciler_;
  std::chrono::milliseconds                         interval_;
  std::chrono::milliseconds                         max_age_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
  std::thread             thread_;
};

} // namespace reconciler::recheck
