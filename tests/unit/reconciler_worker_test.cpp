#include "internal/worker/reconciler_worker.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <numeric>
#include <random>
#include <string>
#include <vector>

#include "internal/cache/version_cache.hpp"
#include "internal/core/reconciler.hpp"
#include "internal/queue/task_queue.hpp"
#include "internal/workflow/template_resolver.hpp"
#include "internal/workflow/workflow_resolver.hpp"
#include "support/fakes.hpp"

namespace {

using reconciler::cache::VersionCache;
using reconciler::core::Reconciler;
using reconciler::model::WorkflowKind;
using reconciler::queue::TaskQueue;
using reconciler::testing::MakeApply;
using reconciler::testing::RecordingFileStore;
using reconciler::worker::WorkerPool;
using reconciler::workflow::TemplateResolver;

// Resolver whose path lookup throws something outside std::exception.
class ForeignThrowingResolver final : public reconciler::workflow::WorkflowResolver {
 public:
  reconciler::model::FilePath ResolvePath(const reconciler::model::Task& task) const override {
    if (task.name == "foreign") throw 42;
    return inner_.ResolvePath(task);
  }

  std::string ResolveContent(const reconciler::model::Task& task) const override {
    return inner_.ResolveContent(task);
  }

  std::string CanonicalPath(const reconciler::model::Task& task) const override {
    return inner_.CanonicalPath(task);
  }

 private:
  TemplateResolver inner_{"/dags"};
};

struct Harness {
  std::shared_ptr<VersionCache>       versions = std::make_shared<VersionCache>();
  std::shared_ptr<RecordingFileStore> files    = std::make_shared<RecordingFileStore>();
  std::shared_ptr<TaskQueue>          queue    = std::make_shared<TaskQueue>();
  std::shared_ptr<Reconciler>         reconciler;

  Harness() {
    reconciler = std::make_shared<Reconciler>(versions, std::make_shared<TemplateResolver>("/dags"), files, nullptr);
  }
};

void TestConcurrentVersionsForOneNameConvergeOnHighest() {
  Harness h;

  std::vector<std::int64_t> versions(200);
  std::iota(versions.begin(), versions.end(), 1);
  std::shuffle(versions.begin(), versions.end(), std::mt19937(7));

  for (auto v : versions) {
    assert(h.queue->Enqueue(MakeApply("a", v, WorkflowKind::kGeneratedB, "wf_a", false, "v" + std::to_string(v))));
  }

  WorkerPool pool(4, h.queue, h.reconciler);
  assert(pool.Size() == 4);
  pool.Start();
  pool.Stop();

  auto record = h.versions->Get("a");
  assert(record.has_value());
  assert(record->version == 200);
  assert(record->content == *h.files->Content("/dags/a-wf_a.py"));
  assert(record->content.find("v200") != std::string::npos);
}

void TestDistinctNamesAreAllApplied() {
  Harness h;

  for (int i = 0; i < 50; ++i) {
    const auto name = "wf" + std::to_string(i);
    assert(h.queue->Enqueue(MakeApply(name, 1, WorkflowKind::kGeneratedA, name, false)));
  }

  WorkerPool pool(3, h.queue, h.reconciler);
  pool.Start();
  pool.Stop();

  assert(h.versions->Size() == 50);
  assert(h.files->Writes().size() == 50);
}

void TestFailingTaskDoesNotStopWorker() {
  Harness h;

  // generated kinds without a workflow id are rejected by the resolver
  assert(h.queue->Enqueue(MakeApply("broken", 1, WorkflowKind::kGeneratedA, "", false)));
  assert(h.queue->Enqueue(MakeApply("good", 1, WorkflowKind::kGeneratedA, "good_wf", false)));

  WorkerPool pool(1, h.queue, h.reconciler);
  pool.Start();
  pool.Stop();

  assert(!h.versions->Contains("broken"));
  assert(h.versions->Contains("good"));
}

void TestNonStandardExceptionDoesNotStopWorker() {
  Harness h;
  auto    reconciler = std::make_shared<Reconciler>(h.versions, std::make_shared<ForeignThrowingResolver>(), h.files,
                                                 nullptr);

  assert(h.queue->Enqueue(MakeApply("foreign", 1, WorkflowKind::kGeneratedA, "wf_f", false)));
  assert(h.queue->Enqueue(MakeApply("good", 1, WorkflowKind::kGeneratedA, "good_wf", false)));

  WorkerPool pool(1, h.queue, reconciler);
  pool.Start();
  pool.Stop();

  assert(!h.versions->Contains("foreign"));
  assert(h.versions->Contains("good"));
}

void TestZeroThreadsStillRunsOneWorker() {
  Harness    h;
  WorkerPool pool(0, h.queue, h.reconciler);
  assert(pool.Size() == 1);

  pool.Start();
  assert(h.queue->Enqueue(MakeApply("a", 1, WorkflowKind::kGeneratedA, "wf", false)));
  pool.Stop();

  assert(h.versions->Contains("a"));
  assert(!h.queue->Enqueue(MakeApply("b", 1, WorkflowKind::kGeneratedA, "wf_b", false)));
}

} // namespace

int main() {
  TestConcurrentVersionsForOneNameConvergeOnHighest();
  TestDistinctNamesAreAllApplied();
  TestFailingTaskDoesNotStopWorker();
  TestNonStandardExceptionDoesNotStopWorker();
  TestZeroThreadsStillRunsOneWorker();

  std::cout << "workflow_reconciler_unit_reconciler_worker: pass\n";
  return 0;
}
