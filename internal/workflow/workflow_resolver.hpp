#pragma once

#include <memory>
#include <string>

#include "internal/model/task.hpp"

namespace reconciler::workflow {

/*
  Turns a task into the concrete file the scheduler should load.

  Implementations throw util::InvalidTask when a WorkflowSpec cannot be
  resolved.
*/
class WorkflowResolver {
 public:
  virtual ~WorkflowResolver() = default;

  virtual model::FilePath ResolvePath(const model::Task& task) const = 0;

  virtual std::string ResolveContent(const model::Task& task) const = 0;

  // Full path a task's file lives at when nothing about it is cached.
  virtual std::string CanonicalPath(const model::Task& task) const = 0;
};

using WorkflowResolverPtr = std::shared_ptr<WorkflowResolver>;

} // namespace reconciler::workflow
