#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/cache/unregistered_workflow_cache.hpp"
#include "internal/cache/version_cache.hpp"
#include "internal/core/pause_reconciler.hpp"
#include "internal/core/reconciler.hpp"
#include "internal/db/api/metadata_store.hpp"
#include "internal/queue/task_queue.hpp"
#include "internal/recheck/pause_recheck_worker.hpp"
#include "internal/worker/reconciler_worker.hpp"

namespace reconciler::factory {

/*
  Application

  Owns all long-lived components. Everything here lives for the lifetime
  of the process. pause and recheck are null when pause support is off.
*/
struct Application {
  std::shared_ptr<queue::TaskQueue>                 queue;
  std::shared_ptr<cache::VersionCache>              versions;
  std::shared_ptr<cache::UnregisteredWorkflowCache> unregistered;
  std::shared_ptr<db::MetadataStore>                metadata;

  std::shared_ptr<core::PauseReconciler> pause;
  std::shared_ptr<core::Reconciler>      reconciler;

  std::unique_ptr<worker::WorkerPool>           workers;
  std::unique_ptr<recheck::PauseRecheckWorker> recheck;

  void Start();
  void Stop();
};

/*
  Build

  Constructs the whole controller from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete store types.
*/
Application Build(const reconciler::runtime::config::RuntimeConfig& config);

} // namespace reconciler::factory
