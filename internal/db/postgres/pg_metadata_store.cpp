#include "pg_metadata_store.hpp"

#include "internal/util/errors.hpp"

namespace reconciler::db::postgres {

PgMetadataStore::PgMetadataStore(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::optional<model::WorkflowRecord> PgMetadataStore::LookupWorkflow(const std::string& workflow_id) {
  try {
    auto conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);
    auto res = tx.exec_prepared("select_workflow", workflow_id);
    if (res.empty()) return std::nullopt;

    model::WorkflowRecord r;
    r.workflow_id = res[0][0].c_str();
    r.paused      = res[0][1].as<bool>();
    return r;
  } catch (const std::exception& e) {
    throw util::MetadataStoreError("lookup workflow " + workflow_id + ": " + e.what());
  }
}

Result PgMetadataStore::SetPaused(const std::string& workflow_id, bool paused) {
  try {
    auto conn = pool_->Acquire();
    pqxx::work tx(*conn);
    auto res = tx.exec_prepared("update_workflow_paused", workflow_id, paused);
    tx.commit();

    if (res.affected_rows() == 0)
      return Result::Err(ErrorCode::NotFound, "workflow " + workflow_id + " is not registered");
    return Result::Ok();
  } catch (const pqxx::broken_connection& e) {
    return Result::Err(ErrorCode::IOError, e.what());
  } catch (const pqxx::serialization_failure& e) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

bool PgMetadataStore::HasImportError(const std::string& file_path) {
  try {
    auto conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);
    return !tx.exec_prepared("select_import_error", file_path).empty();
  } catch (const std::exception& e) {
    throw util::MetadataStoreError("import error lookup " + file_path + ": " + e.what());
  }
}

} // namespace reconciler::db::postgres
