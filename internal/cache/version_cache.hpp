#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/model/workflow_kind.hpp"

namespace reconciler::cache {

/*
  Last applied state of one workflow, keyed by task name.

  `content` is the exact text that was resolved for the file so later
  updates can skip byte-identical rewrites.
*/
struct AppliedRecord {
  std::string  name;
  std::int64_t version = 0;

  model::WorkflowKind kind = model::WorkflowKind::kUnspecified;

  std::string path;
  std::string file_name;
  std::string content;

  std::string FullPath() const {
    return path + file_name;
  }
};

/*
  Concurrent name -> AppliedRecord map.

  Every operation is atomic on its own. Put does not compare versions;
  callers gate writes.
*/
class VersionCache {
 public:
  bool Contains(const std::string& name) const;

  std::optional<AppliedRecord> Get(const std::string& name) const;

  // Present only if the stored record has exactly this version.
  std::optional<AppliedRecord> Get(const std::string& name, std::int64_t version) const;

  void Put(const std::string& name, AppliedRecord record);

  std::size_t Size() const;

 private:
  mutable std::shared_mutex                      mutex_;
  std::unordered_map<std::string, AppliedRecord> cache_;
};

} // namespace reconciler::cache
