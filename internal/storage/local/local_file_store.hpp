#pragma once

#include <string>

#include "internal/storage/file_store.hpp"

namespace reconciler::storage {

/*
  Workflow files on the local filesystem.

  Properties:
    - atomic replace writes (tmp file + rename)
    - parent directories created on demand
*/

class LocalFileStore final : public FileStore {
 public:
  std::string Write(const std::string& path, const std::string& file_name, const std::string& content) override;

  void Remove(const std::string& full_path) override;

  bool Exists(const std::string& full_path) const override;
};

} // namespace reconciler::storage
