#pragma once

#include <stdexcept>
#include <string>

namespace reconciler::util {

/*
  Central error types.

  None of these ever reach the producer; workers log them and drop the task.
*/

// Task cannot be resolved into a file (bad path, missing workflow id, ...).
class InvalidTask : public std::runtime_error {
 public:
  explicit InvalidTask(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Creating, replacing or removing a workflow file failed.
class WriteFailure : public std::runtime_error {
 public:
  explicit WriteFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Scheduler metadata store could not be queried or updated.
class MetadataStoreError : public std::runtime_error {
 public:
  explicit MetadataStoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace reconciler::util
