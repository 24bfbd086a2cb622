#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace dockyard::build {

/*
  Ignore rules in the .dockyardignore format: one glob per entry, matched
  against '/'-separated context paths. A rule matching a directory excludes
  everything below it. "!pattern" re-includes; the last matching rule wins.
*/
class IgnoreMatcher {
 public:
  explicit IgnoreMatcher(const std::vector<std::string>& patterns = {});

  bool Ignored(const std::string& relative_path) const;

 private:
  struct Rule {
    std::string pattern;
    bool        negated = false;
  };

  std::vector<Rule> rules_;
};

/*
  Files a build can copy from. Paths are relative to the context root.
  Ignored files are invisible: they are neither listed nor readable.
*/
class BuildContext {
 public:
  virtual ~BuildContext() = default;

  // Sorted.
  virtual std::vector<std::string> ListFiles() const = 0;

  // Throws util::NotFound.
  virtual std::string ReadFile(const std::string& relative_path) const = 0;
};

class MemoryBuildContext final : public BuildContext {
 public:
  explicit MemoryBuildContext(std::map<std::string, std::string> files = {}, const std::vector<std::string>& ignore = {});

  void SetFile(const std::string& relative_path, std::string content);
  bool RemoveFile(const std::string& relative_path);

  std::vector<std::string> ListFiles() const override;
  std::string              ReadFile(const std::string& relative_path) const override;

 private:
  mutable std::mutex                 mutex_;
  std::map<std::string, std::string> files_;
  IgnoreMatcher                      ignore_;
};

class DirectoryBuildContext final : public BuildContext {
 public:
  static constexpr const char* kIgnoreFile = ".dockyardignore";

  // Rules from <root>/.dockyardignore apply before the extra ones.
  explicit DirectoryBuildContext(std::filesystem::path root, const std::vector<std::string>& extra_ignore = {});

  std::vector<std::string> ListFiles() const override;
  std::string              ReadFile(const std::string& relative_path) const override;

 private:
  std::filesystem::path root_;
  IgnoreMatcher         ignore_;
};

} // namespace dockyard::build
