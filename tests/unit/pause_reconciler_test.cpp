#include "internal/core/pause_reconciler.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/cache/unregistered_workflow_cache.hpp"
#include "support/fakes.hpp"

namespace {

using reconciler::cache::UnregisteredWorkflowCache;
using reconciler::core::PauseReconciler;
using reconciler::model::WorkflowKind;
using reconciler::testing::HookedMetadataStore;
using reconciler::testing::MakeApply;

struct Harness {
  std::shared_ptr<HookedMetadataStore>       metadata     = std::make_shared<HookedMetadataStore>();
  std::shared_ptr<UnregisteredWorkflowCache> unregistered = std::make_shared<UnregisteredWorkflowCache>();
  PauseReconciler                            pause{metadata, unregistered};
};

void TestMismatchIssuesExactlyOnePauseCommand() {
  Harness h;
  h.metadata->Inner().Register("wf_a", false);

  h.pause.Reconcile(MakeApply("a", 1, WorkflowKind::kGeneratedA, "wf_a", true), "/dags/a-wf_a.py");

  auto calls = h.metadata->PauseCalls();
  assert(calls.size() == 1);
  assert(calls[0].first == "wf_a");
  assert(calls[0].second);
  assert(h.metadata->Inner().LookupWorkflow("wf_a")->paused);
}

void TestMatchingFlagIssuesNoCommand() {
  Harness h;
  h.metadata->Inner().Register("wf_a", true);

  h.pause.Reconcile(MakeApply("a", 1, WorkflowKind::kGeneratedA, "wf_a", true), "/dags/a-wf_a.py");
  h.pause.Reconcile(MakeApply("a", 1, WorkflowKind::kGeneratedA, "wf_a", true), "");

  assert(h.metadata->PauseCalls().empty());
  assert(h.unregistered->Size() == 0);
}

void TestUnregisteredAfterWriteIsQueued() {
  Harness h;

  auto task       = MakeApply("a", 1, WorkflowKind::kGeneratedB, "wf_a", true);
  task.name_space = "team";
  h.pause.Reconcile(task, "/dags/a-wf_a.py");

  auto pending = h.unregistered->Snapshot();
  assert(pending.size() == 1);
  assert(pending[0].workflow_id == "wf_a");
  assert(pending[0].written_path == "/dags/a-wf_a.py");
  assert(pending[0].name_space == "team");
  assert(pending[0].name == "a");
  assert(pending[0].paused);
  assert(pending[0].version == 1);
  assert(h.metadata->PauseCalls().empty());
}

void TestUnregisteredWithoutWriteIsIgnored() {
  Harness h;

  h.pause.Reconcile(MakeApply("a", 1, WorkflowKind::kGeneratedA, "wf_a", true), "");

  assert(h.unregistered->Size() == 0);
  assert(h.metadata->ImportErrorChecks() == 0);
}

void TestImportErrorIsNotQueued() {
  Harness h;
  h.metadata->Inner().RecordImportError("/dags/a-wf_a.py");

  h.pause.Reconcile(MakeApply("a", 1, WorkflowKind::kGeneratedA, "wf_a", true), "/dags/a-wf_a.py");

  assert(h.metadata->ImportErrorChecks() == 1);
  assert(h.unregistered->Size() == 0);
}

void TestLookupFailureIsSwallowed() {
  Harness h;
  h.metadata->FailLookups(true);

  h.pause.Reconcile(MakeApply("a", 1, WorkflowKind::kGeneratedA, "wf_a", true), "/dags/a-wf_a.py");

  assert(h.metadata->PauseCalls().empty());
  assert(h.unregistered->Size() == 0);
}

void TestPauseCommandFailureIsSwallowed() {
  Harness h;
  h.metadata->Inner().Register("wf_a", false);
  h.metadata->FailSetPaused(true);

  h.pause.Reconcile(MakeApply("a", 1, WorkflowKind::kGeneratedA, "wf_a", true), "/dags/a-wf_a.py");

  assert(h.metadata->PauseCalls().size() == 1);
  assert(!h.metadata->Inner().LookupWorkflow("wf_a")->paused);
  assert(h.unregistered->Size() == 0);
}

void TestImportErrorLookupFailureIsSwallowed() {
  Harness h;
  h.metadata->FailImportErrors(true);

  h.pause.Reconcile(MakeApply("a", 1, WorkflowKind::kGeneratedA, "wf_a", true), "/dags/a-wf_a.py");

  assert(h.metadata->ImportErrorChecks() == 1);
  assert(h.metadata->PauseCalls().empty());
  assert(h.unregistered->Size() == 0);
}

void TestRegisteredWorkflowRetiresParkedEntry() {
  Harness h;

  h.pause.Reconcile(MakeApply("a", 1, WorkflowKind::kGeneratedA, "wf_a", true), "/dags/a-wf_a.py");
  assert(h.unregistered->Size() == 1);

  h.metadata->Inner().Register("wf_a", false);
  h.pause.Reconcile(MakeApply("a", 2, WorkflowKind::kGeneratedA, "wf_a", false), "");

  assert(h.unregistered->Size() == 0);
  assert(h.metadata->PauseCalls().empty());
}

void TestRecheckOutcomes() {
  Harness h;

  reconciler::cache::PendingPauseRecheck pending;
  pending.workflow_id  = "wf_a";
  pending.written_path = "/dags/a-wf_a.py";
  pending.paused       = true;

  assert(h.pause.Recheck(pending) == PauseReconciler::RecheckOutcome::kPending);

  h.metadata->Inner().RecordImportError("/dags/a-wf_a.py");
  assert(h.pause.Recheck(pending) == PauseReconciler::RecheckOutcome::kImportError);

  h.metadata->Inner().ClearImportError("/dags/a-wf_a.py");
  h.metadata->Inner().Register("wf_a", false);
  assert(h.pause.Recheck(pending) == PauseReconciler::RecheckOutcome::kApplied);
  assert(h.metadata->PauseCalls().size() == 1);

  h.metadata->Inner().Register("wf_a", false);
  h.metadata->FailSetPaused(true);
  assert(h.pause.Recheck(pending) == PauseReconciler::RecheckOutcome::kFailed);

  h.metadata->FailImportErrors(true);
  h.metadata->Inner().Unregister("wf_a");
  assert(h.pause.Recheck(pending) == PauseReconciler::RecheckOutcome::kFailed);

  h.metadata->FailLookups(true);
  assert(h.pause.Recheck(pending) == PauseReconciler::RecheckOutcome::kFailed);
}

} // namespace

int main() {
  TestMismatchIssuesExactlyOnePauseCommand();
  TestMatchingFlagIssuesNoCommand();
  TestUnregisteredAfterWriteIsQueued();
  TestUnregisteredWithoutWriteIsIgnored();
  TestImportErrorIsNotQueued();
  TestLookupFailureIsSwallowed();
  TestPauseCommandFailureIsSwallowed();
  TestImportErrorLookupFailureIsSwallowed();
  TestRegisteredWorkflowRetiresParkedEntry();
  TestRecheckOutcomes();

  std::cout << "workflow_reconciler_unit_pause_reconciler: pass\n";
  return 0;
}
