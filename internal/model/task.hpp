#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/model/workflow_kind.hpp"

namespace reconciler::model {

enum class TaskAction : std::uint8_t {
  kApply = 0,
  kDelete = 1,
};

constexpr std::string_view ToString(TaskAction action) {
  return action == TaskAction::kDelete ? "delete" : "apply";
}

/*
  Desired state of one workflow file.

  raw_file:      content is written verbatim to path/file_name
  generated_*:   path/file name follow the workflow_id naming convention and
                 content is rendered from `content`
*/
struct WorkflowSpec {
  WorkflowKind kind = WorkflowKind::kUnspecified;

  std::string path;
  std::string file_name;
  std::string workflow_id;

  bool paused = false;

  std::string content;
};

/*
  One desired-state change delivered by the producer.

  `name` is the controller-level key. `version` is supplied by the producer
  and is non-decreasing per name; queue order carries no meaning.
*/
struct Task {
  std::string name;
  std::string name_space;

  std::int64_t version = 0;

  TaskAction action = TaskAction::kApply;

  WorkflowSpec spec;
};

struct FilePath {
  std::string path;       // directory, always ends with '/'
  std::string file_name;

  std::string FullPath() const {
    return path + file_name;
  }
};

}  // namespace reconciler::model
