#include "internal/build/build_context.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <fstream>
#include <sstream>

#include "internal/util/errors.hpp"
#include "internal/util/path.hpp"

namespace dockyard::build {

namespace fs = std::filesystem;

namespace {

std::string Trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r");
  if (begin == std::string::npos) return {};
  const auto end = value.find_last_not_of(" \t\r");
  return value.substr(begin, end - begin + 1);
}

std::vector<std::string> ReadIgnoreFile(const fs::path& path) {
  std::vector<std::string> patterns;
  std::ifstream            in(path);
  if (!in) return patterns;

  std::string line;
  while (std::getline(in, line)) {
    line = Trim(line);
    if (line.empty() || line.front() == '#') continue;
    patterns.push_back(line);
  }
  return patterns;
}

} // namespace

IgnoreMatcher::IgnoreMatcher(const std::vector<std::string>& patterns) {
  for (const auto& raw : patterns) {
    auto pattern = Trim(raw);
    Rule rule;
    if (!pattern.empty() && pattern.front() == '!') {
      rule.negated = true;
      pattern.erase(0, 1);
    }
    while (!pattern.empty() && pattern.front() == '/') pattern.erase(0, 1);
    while (!pattern.empty() && pattern.back() == '/') pattern.pop_back();
    if (pattern.empty()) continue;

    rule.pattern = std::move(pattern);
    rules_.push_back(std::move(rule));
  }
}

bool IgnoreMatcher::Ignored(const std::string& relative_path) const {
  bool ignored = false;
  for (const auto& rule : rules_) {
    // the path itself or any of its parent directories
    std::string candidate;
    bool        matched = false;
    for (const auto& segment : util::PathSegments(relative_path)) {
      candidate = candidate.empty() ? segment : candidate + "/" + segment;
      if (::fnmatch(rule.pattern.c_str(), candidate.c_str(), FNM_PATHNAME) == 0) {
        matched = true;
        break;
      }
    }
    if (matched) ignored = !rule.negated;
  }
  return ignored;
}

MemoryBuildContext::MemoryBuildContext(std::map<std::string, std::string> files, const std::vector<std::string>& ignore) : ignore_(ignore) {
  for (auto& [path, content] : files) files_[util::NormalizeRelativePath(path)] = std::move(content);
}

void MemoryBuildContext::SetFile(const std::string& relative_path, std::string content) {
  std::lock_guard<std::mutex> lock(mutex_);
  files_[util::NormalizeRelativePath(relative_path)] = std::move(content);
}

bool MemoryBuildContext::RemoveFile(const std::string& relative_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  return files_.erase(util::NormalizeRelativePath(relative_path)) > 0;
}

std::vector<std::string> MemoryBuildContext::ListFiles() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string>    out;
  for (const auto& [path, content] : files_) {
    if (!ignore_.Ignored(path)) out.push_back(path);
  }
  return out;
}

std::string MemoryBuildContext::ReadFile(const std::string& relative_path) const {
  const auto                  path = util::NormalizeRelativePath(relative_path);
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = files_.find(path);
  if (it == files_.end() || ignore_.Ignored(path)) throw util::NotFound("build context file not found: " + path);
  return it->second;
}

DirectoryBuildContext::DirectoryBuildContext(fs::path root, const std::vector<std::string>& extra_ignore) : root_(std::move(root)) {
  if (!fs::is_directory(root_)) throw util::NotFound("build context directory not found: " + root_.string());

  auto patterns = ReadIgnoreFile(root_ / kIgnoreFile);
  patterns.insert(patterns.end(), extra_ignore.begin(), extra_ignore.end());
  ignore_ = IgnoreMatcher(patterns);
}

std::vector<std::string> DirectoryBuildContext::ListFiles() const {
  std::vector<std::string> out;
  // ignored directories are still walked: a later "!" rule may re-include files below them
  for (const auto& entry : fs::recursive_directory_iterator(root_)) {
    if (!entry.is_regular_file()) continue;
    const auto relative = fs::relative(entry.path(), root_).generic_string();
    if (!ignore_.Ignored(relative)) out.push_back(relative);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::string DirectoryBuildContext::ReadFile(const std::string& relative_path) const {
  const auto path = util::NormalizeRelativePath(relative_path);
  if (ignore_.Ignored(path)) throw util::NotFound("build context file not found: " + path);

  std::ifstream in(root_ / path, std::ios::binary);
  if (!in) throw util::NotFound("build context file not found: " + path);

  std::ostringstream content;
  content << in.rdbuf();
  return content.str();
}

} // namespace dockyard::build
