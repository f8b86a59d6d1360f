#include "manifest_source.hpp"

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/queue/task_queue.hpp"
#include "internal/util/errors.hpp"

namespace reconciler::source {

using observability::IntField;
using observability::StringField;

namespace {

model::WorkflowKind KindFromProto(reconciler::v1::WorkflowKind kind) {
  switch (kind) {
    case reconciler::v1::WORKFLOW_KIND_RAW_FILE:
      return model::WorkflowKind::kRawFile;
    case reconciler::v1::WORKFLOW_KIND_GENERATED_A:
      return model::WorkflowKind::kGeneratedA;
    case reconciler::v1::WORKFLOW_KIND_GENERATED_B:
      return model::WorkflowKind::kGeneratedB;
    default:
      return model::WorkflowKind::kUnspecified;
  }
}

} // namespace

model::Task FromProto(const reconciler::v1::Task& in) {
  if (in.name().empty()) {
    throw util::InvalidTask("task has no name");
  }

  model::Task task;
  task.name       = in.name();
  task.name_space = in.namespace_();
  task.version    = in.version();

  switch (in.action()) {
    case reconciler::v1::TASK_ACTION_APPLY:
      task.action = model::TaskAction::kApply;
      break;
    case reconciler::v1::TASK_ACTION_DELETE:
      task.action = model::TaskAction::kDelete;
      break;
    default:
      throw util::InvalidTask("task " + in.name() + " has no action");
  }

  const auto& spec      = in.spec();
  task.spec.kind        = KindFromProto(spec.kind());
  task.spec.path        = spec.path();
  task.spec.file_name   = spec.file_name();
  task.spec.workflow_id = spec.workflow_id();
  task.spec.paused      = spec.paused();
  task.spec.content     = spec.content();
  return task;
}

std::size_t EnqueueManifest(const std::string& path, queue::TaskQueue& queue) {
  auto manifest = config::ConfigLoader::LoadTaskManifest(path);

  std::size_t enqueued = 0;
  for (const auto& entry : manifest.tasks()) {
    try {
      if (!queue.Enqueue(FromProto(entry))) break;
      ++enqueued;
    } catch (const util::InvalidTask& e) {
      RECONCILER_LOG_WARN("Skipping manifest entry", {StringField("path", path), StringField("error", e.what())});
    }
  }

  RECONCILER_LOG_INFO("Manifest enqueued",
                      {StringField("path", path), IntField("tasks", static_cast<std::int64_t>(enqueued))});
  return enqueued;
}

} // namespace reconciler::source
