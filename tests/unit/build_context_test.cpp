#include "internal/build/build_context.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using dockyard::build::DirectoryBuildContext;
using dockyard::build::IgnoreMatcher;
using dockyard::build::MemoryBuildContext;

void TestIgnoreRules() {
  IgnoreMatcher matcher({"node_modules", "*.log", "!keep.log", "build/", "**/*.tmp"});

  assert(matcher.Ignored("node_modules"));
  assert(matcher.Ignored("node_modules/left-pad/index.js"));
  assert(matcher.Ignored("debug.log"));
  assert(!matcher.Ignored("keep.log"));
  assert(!matcher.Ignored("logs/debug.log"));
  assert(matcher.Ignored("build/out.o"));
  assert(matcher.Ignored("src/x.tmp"));
  assert(!matcher.Ignored("src/main.c"));
}

void TestLastMatchingRuleWins() {
  IgnoreMatcher matcher({"!vendor/keep.c", "vendor"});
  assert(matcher.Ignored("vendor/keep.c"));

  IgnoreMatcher reincluded({"vendor", "!vendor/keep.c"});
  assert(!reincluded.Ignored("vendor/keep.c"));
  assert(reincluded.Ignored("vendor/drop.c"));
}

void TestMemoryContextHidesIgnoredFiles() {
  MemoryBuildContext context({{"src/main.c", "int main;"}, {"./README", "hi"}, {"secrets.env", "x"}}, {"secrets.env"});

  const auto files = context.ListFiles();
  assert(files.size() == 2);
  assert(files[0] == "README");
  assert(files[1] == "src/main.c");
  assert(context.ReadFile("src//main.c") == "int main;");

  bool threw = false;
  try {
    context.ReadFile("secrets.env");
  } catch (const dockyard::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  context.SetFile("src/util.c", "u");
  assert(context.ListFiles().size() == 3);
  assert(context.RemoveFile("src/util.c"));
  assert(!context.RemoveFile("src/util.c"));
}

void TestDirectoryContextReadsIgnoreFile() {
  const auto root = std::filesystem::temp_directory_path() / "dockyard_build_context_test";
  std::filesystem::remove_all(root);
  std::filesystem::create_directories(root / "src");
  std::filesystem::create_directories(root / "node_modules" / "pkg");

  auto write = [&root](const std::string& path, const std::string& content) {
    std::ofstream out(root / path, std::ios::binary);
    out << content;
  };
  write(".dockyardignore", "# deps\nnode_modules\n\n*.log\n");
  write("src/app.js", "console.log(1)");
  write("node_modules/pkg/index.js", "module.exports = 1");
  write("npm-debug.log", "boom");
  write("package.json", "{}");

  DirectoryBuildContext context(root, {"package.json"});
  const auto            files = context.ListFiles();
  assert(files.size() == 2);
  assert(files[0] == ".dockyardignore");
  assert(files[1] == "src/app.js");
  assert(context.ReadFile("src/app.js") == "console.log(1)");

  bool threw = false;
  try {
    context.ReadFile("package.json");
  } catch (const dockyard::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  std::filesystem::remove_all(root);
}

} // namespace

int main() {
  TestIgnoreRules();
  TestLastMatchingRuleWins();
  TestMemoryContextHidesIgnoredFiles();
  TestDirectoryContextReadsIgnoreFile();

  std::cout << "dockyard_unit_build_context: pass\n";
  return 0;
}
