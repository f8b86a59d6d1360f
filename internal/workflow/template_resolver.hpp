#pragma once

#include <filesystem>
#include <string>

#include "internal/workflow/workflow_resolver.hpp"

namespace reconciler::workflow {

/*
  Naming and rendering conventions for workflow files under one root.

    raw_file     <root>/<path>/<file_name>, content verbatim
    generated_a  <root>/<path>/<name>-<workflow_id>.py, YAML definition
                 wrapped in a python loader
    generated_b  <root>/<path>/<name>-<workflow_id>.py, python source with
                 a managed-file header
*/
class TemplateResolver final : public WorkflowResolver {
 public:
  explicit TemplateResolver(std::filesystem::path root);

  model::FilePath ResolvePath(const model::Task& task) const override;

  std::string ResolveContent(const model::Task& task) const override;

  std::string CanonicalPath(const model::Task& task) const override;

  static std::string GeneratedFileName(const std::string& name, const std::string& workflow_id);

 private:
  std::string Directory(const model::Task& task) const;

  std::filesystem::path root_;
};

} // namespace reconciler::workflow
