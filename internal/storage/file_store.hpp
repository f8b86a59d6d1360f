#pragma once

#include <memory>
#include <string>

namespace reconciler::storage {

/*
  Workflow file storage abstraction.

  Paths are full filesystem paths as produced by the resolver; directories
  end with '/'. All calls are synchronous and throw util::WriteFailure on
  error.
*/

class FileStore {
 public:
  virtual ~FileStore() = default;

  // ------------------------------------------------------------------
  // Write
  // ------------------------------------------------------------------
  /*
    Replace path+file_name with content.

    Missing parent directories are created. Returns the full path written.
  */
  virtual std::string Write(const std::string& path, const std::string& file_name, const std::string& content) = 0;

  // ------------------------------------------------------------------
  // Remove
  // ------------------------------------------------------------------
  /*
    Delete a single file. Removing a file that does not exist is a no-op.
  */
  virtual void Remove(const std::string& full_path) = 0;

  // ------------------------------------------------------------------
  // Exists
  // ------------------------------------------------------------------
  virtual bool Exists(const std::string& full_path) const = 0;
};

using FileStorePtr = std::shared_ptr<FileStore>;

} // namespace reconciler::storage
