#include "factory.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>

#include "internal/db/memory/memory_metadata_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_metadata_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/local/local_file_store.hpp"
#include "internal/util/time.hpp"
#include "internal/workflow/template_resolver.hpp"
#if RECONCILER_DB_POSTGRES
#include "internal/db/postgres/pg_metadata_store.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#endif

namespace reconciler::factory {

using observability::StringField;

namespace {

constexpr const char*               kDefaultWorkflowsRoot = "/opt/airflow/dags";
constexpr std::chrono::milliseconds kDefaultRecheckInterval{30'000};
constexpr std::chrono::milliseconds kDefaultRecheckMaxAge{600'000};

std::shared_ptr<db::MetadataStore> BuildMetadataStore(const reconciler::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    RECONCILER_LOG_INFO("Using sqlite scheduler metadata store", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteMetadataStore>(std::move(sqlite_db));
  }

  if (database.has_postgres()) {
#if RECONCILER_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(),
                                                       database.postgres().max_connections() == 0 ? 4 : database.postgres().max_connections());
    RECONCILER_LOG_INFO("Using postgres scheduler metadata store");
    return std::make_shared<db::postgres::PgMetadataStore>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryMetadataStore>();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const reconciler::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Shared state
  // ------------------------------------------------------------------
  app.queue        = std::make_shared<queue::TaskQueue>();
  app.versions     = std::make_shared<cache::VersionCache>();
  app.unregistered = std::make_shared<cache::UnregisteredWorkflowCache>();

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  std::filesystem::path root =
      config.workflows().root().empty() ? std::filesystem::path{kDefaultWorkflowsRoot} : std::filesystem::path{config.workflows().root()};
  auto resolver = std::make_shared<workflow::TemplateResolver>(std::move(root));
  auto files    = std::make_shared<storage::LocalFileStore>();

  app.metadata = BuildMetadataStore(config);

  // ------------------------------------------------------------------
  // Reconciliation
  // ------------------------------------------------------------------
  if (config.workflows().support_pause()) {
    app.pause = std::make_shared<core::PauseReconciler>(app.metadata, app.unregistered);
  }
  app.reconciler = std::make_shared<core::Reconciler>(app.versions, resolver, files, app.pause);

  app.workers = std::make_unique<worker::WorkerPool>(config.workers().threads(), app.queue, app.reconciler);

  if (app.pause) {
    app.recheck = std::make_unique<recheck::PauseRecheckWorker>(
        app.unregistered, app.reconciler, util::MillisOr(config.recheck().interval_ms(), kDefaultRecheckInterval),
        util::MillisOr(config.recheck().max_age_ms(), kDefaultRecheckMaxAge));
  }

  return app;
}

void Application::Start() {
  workers->Start();
  if (recheck) recheck->Start();
}

void Application::Stop() {
  if (recheck) recheck->Stop();
  workers->Stop();
}

} // namespace reconciler::factory
