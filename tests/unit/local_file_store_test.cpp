#include "internal/storage/local/local_file_store.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using reconciler::storage::LocalFileStore;

std::filesystem::path FreshDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "workflow_reconciler_file_store_tests" / test_name;
  std::filesystem::remove_all(dir);
  return dir;
}

std::string ReadAll(const std::string& path) {
  std::ifstream     in(path, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void TestWriteCreatesDirectoriesAndOverwrites() {
  LocalFileStore store;
  const auto     dir = (FreshDir("write") / "nested" / "deeper").string() + "/";

  auto written = store.Write(dir, "flow.py", "first");
  assert(written == dir + "flow.py");
  assert(store.Exists(written));
  assert(ReadAll(written) == "first");

  store.Write(dir, "flow.py", "second");
  assert(ReadAll(written) == "second");
  assert(!std::filesystem::exists(written + ".tmp"));
}

void TestRemoveDeletesAndToleratesMissing() {
  LocalFileStore store;
  const auto     dir = FreshDir("remove").string() + "/";

  auto written = store.Write(dir, "flow.py", "x");
  store.Remove(written);
  assert(!store.Exists(written));

  store.Remove(written);
}

void TestExistsIgnoresDirectories() {
  LocalFileStore store;
  const auto     dir = FreshDir("exists");
  std::filesystem::create_directories(dir / "sub");

  assert(!store.Exists((dir / "sub").string()));
  assert(!store.Exists((dir / "missing.py").string()));
}

void TestWriteFailureIsReported() {
  LocalFileStore store;
  const auto     dir = FreshDir("blocked");
  std::filesystem::create_directories(dir);

  // a regular file where a directory is expected
  std::ofstream(dir / "blocker") << "x";

  bool threw = false;
  try {
    store.Write((dir / "blocker").string() + "/", "flow.py", "content");
  } catch (const reconciler::util::WriteFailure&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestWriteCreatesDirectoriesAndOverwrites();
  TestRemoveDeletesAndToleratesMissing();
  TestExistsIgnoresDirectories();
  TestWriteFailureIsReported();

  std::cout << "workflow_reconciler_unit_local_file_store: pass\n";
  return 0;
}
