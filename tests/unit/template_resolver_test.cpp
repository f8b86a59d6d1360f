#include "internal/workflow/template_resolver.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using reconciler::model::WorkflowKind;
using reconciler::testing::MakeApply;
using reconciler::util::InvalidTask;
using reconciler::workflow::TemplateResolver;

template <typename Fn>
bool ThrowsInvalidTask(Fn&& fn) {
  try {
    fn();
  } catch (const InvalidTask&) {
    return true;
  }
  return false;
}

void TestRawFileUsesSpecNameAndVerbatimContent() {
  TemplateResolver resolver("/opt/dags");
  auto             task = MakeApply("r", 1, WorkflowKind::kRawFile, "", false, "x = 1\n");
  task.spec.path      = "team/etl";
  task.spec.file_name = "job.py";

  auto fp = resolver.ResolvePath(task);
  assert(fp.path == "/opt/dags/team/etl/");
  assert(fp.file_name == "job.py");
  assert(resolver.ResolveContent(task) == "x = 1\n");
  assert(resolver.CanonicalPath(task) == "/opt/dags/team/etl/job.py");
}

void TestGeneratedKindsFollowWorkflowIdConvention() {
  TemplateResolver resolver("/opt/dags/");
  auto             a = MakeApply("orders", 1, WorkflowKind::kGeneratedA, "orders_daily", true, "schedule: '@daily'\n");
  auto             b = MakeApply("orders", 1, WorkflowKind::kGeneratedB, "orders_daily", false, "print('x')");

  assert(resolver.ResolvePath(a).FullPath() == "/opt/dags/orders-orders_daily.py");
  assert(resolver.ResolvePath(b).FullPath() == "/opt/dags/orders-orders_daily.py");

  const auto yaml_loader = resolver.ResolveContent(a);
  assert(yaml_loader.find("DAG_ID = 'orders_daily'") != std::string::npos);
  assert(yaml_loader.find("IS_PAUSED_UPON_CREATION = True") != std::string::npos);
  assert(yaml_loader.find("schedule: \\'@daily\\'\\n") != std::string::npos);

  const auto python = resolver.ResolveContent(b);
  assert(python.find("# dag_id: orders_daily") != std::string::npos);
  assert(python.find("print('x')\n") != std::string::npos);
}

void TestContentIsDeterministic() {
  TemplateResolver resolver("/opt/dags");
  auto             task = MakeApply("a", 1, WorkflowKind::kGeneratedA, "wf", false, "tasks: []\n");

  assert(resolver.ResolveContent(task) == resolver.ResolveContent(task));
}

void TestInvalidSpecsAreRejected() {
  TemplateResolver resolver("/opt/dags");

  auto escaping      = MakeApply("r", 1, WorkflowKind::kRawFile, "", false);
  escaping.spec.path = "../etc";
  escaping.spec.file_name = "passwd";
  assert(ThrowsInvalidTask([&] { (void)resolver.ResolvePath(escaping); }));

  auto absolute           = MakeApply("r", 1, WorkflowKind::kRawFile, "", false);
  absolute.spec.path      = "/etc";
  absolute.spec.file_name = "passwd";
  assert(ThrowsInvalidTask([&] { (void)resolver.ResolvePath(absolute); }));

  auto nested_name           = MakeApply("r", 1, WorkflowKind::kRawFile, "", false);
  nested_name.spec.file_name = "a/b.py";
  assert(ThrowsInvalidTask([&] { (void)resolver.ResolvePath(nested_name); }));

  auto no_id = MakeApply("g", 1, WorkflowKind::kGeneratedA, "", false);
  assert(ThrowsInvalidTask([&] { (void)resolver.ResolvePath(no_id); }));
  assert(ThrowsInvalidTask([&] { (void)resolver.ResolveContent(no_id); }));

  auto no_kind = MakeApply("u", 1, WorkflowKind::kUnspecified, "wf", false);
  assert(ThrowsInvalidTask([&] { (void)resolver.ResolvePath(no_kind); }));
}

} // namespace

int main() {
  TestRawFileUsesSpecNameAndVerbatimContent();
  TestGeneratedKindsFollowWorkflowIdConvention();
  TestContentIsDeterministic();
  TestInvalidSpecsAreRejected();

  std::cout << "workflow_reconciler_unit_template_resolver: pass\n";
  return 0;
}
