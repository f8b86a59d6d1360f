#include "local_file_store.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace reconciler::storage {

using observability::StringField;

namespace {

[[noreturn]] void Fail(const std::string& what, const std::string& path, const std::error_code& ec) {
  throw util::WriteFailure(what + " " + path + ": " + ec.message());
}

} // namespace

/*
  Atomic write:
      write tmp → flush → rename
*/
std::string LocalFileStore::Write(const std::string& path, const std::string& file_name, const std::string& content) {
  std::error_code ec;

  const std::filesystem::path dir(path);
  if (!std::filesystem::exists(dir, ec)) {
    RECONCILER_LOG_DEBUG("Folder does not exist, creating it", {StringField("path", path)});
    std::filesystem::create_directories(dir, ec);
    if (ec) Fail("create directories", path, ec);
  }

  const std::string final_path = path + file_name;
  const std::string tmp_path   = final_path + ".tmp";

  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw util::WriteFailure("open " + tmp_path + " for writing failed");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
      out.close();
      std::filesystem::remove(tmp_path, ec);
      throw util::WriteFailure("write " + tmp_path + " failed");
    }
  }

  std::filesystem::rename(tmp_path, final_path, ec);
  if (ec) {
    std::error_code cleanup;
    std::filesystem::remove(tmp_path, cleanup);
    Fail("rename", final_path, ec);
  }

  return final_path;
}

void LocalFileStore::Remove(const std::string& full_path) {
  std::error_code ec;
  std::filesystem::remove(full_path, ec);
  if (ec) Fail("remove", full_path, ec);
}

bool LocalFileStore::Exists(const std::string& full_path) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(full_path, ec);
}

} // namespace reconciler::storage
