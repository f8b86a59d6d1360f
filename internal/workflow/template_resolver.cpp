#include "template_resolver.hpp"

#include <sstream>
#include <stdexcept>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace reconciler::workflow {

using model::WorkflowKind;

namespace {

constexpr const char* kManagedHeader = "# Managed by workflow-reconciler. Local edits are overwritten.";

void RequireWorkflowId(const model::Task& task) {
  if (task.spec.workflow_id.empty()) {
    throw util::InvalidTask("workflow " + task.name + " of kind " + std::string(model::ToString(task.spec.kind)) +
                            " has no workflow id");
  }
}

// Single-quoted python literal safe for embedding arbitrary text.
std::string PythonLiteral(const std::string& text) {
  std::string out = "'";
  for (char c : text) {
    switch (c) {
      case '\\':
        out += "\\\\";
        break;
      case '\'':
        out += "\\'";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

std::string RenderYamlLoader(const model::Task& task) {
  std::ostringstream out;
  out << kManagedHeader << "\n"
      << "# resource: " << task.name_space << "/" << task.name << "\n"
      << "import yaml\n"
      << "from airflow import DAG\n"
      << "from dagfactory import DagFactory\n"
      << "\n"
      << "DAG_ID = " << PythonLiteral(task.spec.workflow_id) << "\n"
      << "IS_PAUSED_UPON_CREATION = " << (task.spec.paused ? "True" : "False") << "\n"
      << "DEFINITION = yaml.safe_load(" << PythonLiteral(task.spec.content) << ")\n"
      << "\n"
      << "DagFactory(config={DAG_ID: {**DEFINITION, 'is_paused_upon_creation': IS_PAUSED_UPON_CREATION}})"
      << ".generate_dags(globals())\n";
  return out.str();
}

std::string RenderPythonSource(const model::Task& task) {
  std::ostringstream out;
  out << kManagedHeader << "\n"
      << "# resource: " << task.name_space << "/" << task.name << "\n"
      << "# dag_id: " << task.spec.workflow_id << "\n"
      << "\n"
      << task.spec.content;
  if (!task.spec.content.empty() && task.spec.content.back() != '\n') {
    out << "\n";
  }
  return out.str();
}

} // namespace

TemplateResolver::TemplateResolver(std::filesystem::path root)
    : root_(std::move(root)) {
  if (root_.empty()) {
    throw std::invalid_argument("workflows root must not be empty");
  }
}

std::string TemplateResolver::GeneratedFileName(const std::string& name, const std::string& workflow_id) {
  return name + "-" + workflow_id + ".py";
}

std::string TemplateResolver::Directory(const model::Task& task) const {
  try {
    return storage::common::DirectoryUnder(root_, task.spec.path);
  } catch (const std::invalid_argument& e) {
    throw util::InvalidTask("workflow " + task.name + ": " + e.what());
  }
}

model::FilePath TemplateResolver::ResolvePath(const model::Task& task) const {
  model::FilePath fp;
  fp.path = Directory(task);

  switch (task.spec.kind) {
    case WorkflowKind::kRawFile:
      fp.file_name = task.spec.file_name;
      break;
    case WorkflowKind::kGeneratedA:
    case WorkflowKind::kGeneratedB:
      RequireWorkflowId(task);
      fp.file_name = GeneratedFileName(task.name, task.spec.workflow_id);
      break;
    case WorkflowKind::kUnspecified:
    default:
      throw util::InvalidTask("workflow " + task.name + " has no kind");
  }

  try {
    storage::common::ValidateFileName(fp.file_name);
  } catch (const std::invalid_argument& e) {
    throw util::InvalidTask("workflow " + task.name + ": " + e.what());
  }
  return fp;
}

std::string TemplateResolver::ResolveContent(const model::Task& task) const {
  switch (task.spec.kind) {
    case WorkflowKind::kRawFile:
      return task.spec.content;
    case WorkflowKind::kGeneratedA:
      RequireWorkflowId(task);
      return RenderYamlLoader(task);
    case WorkflowKind::kGeneratedB:
      RequireWorkflowId(task);
      return RenderPythonSource(task);
    case WorkflowKind::kUnspecified:
    default:
      throw util::InvalidTask("workflow " + task.name + " has no kind");
  }
}

std::string TemplateResolver::CanonicalPath(const model::Task& task) const {
  return ResolvePath(task).FullPath();
}

} // namespace reconciler::workflow
