#include "internal/layer/rootfs.hpp"

#include <set>

#include "internal/util/path.hpp"

namespace dockyard::layer {

namespace {

// First key strictly below directory. Keys under "/app/" are contiguous,
// while "/app-x" sorts between "/app" and "/app/".
RootFs::FileMap::const_iterator ChildrenBegin(const RootFs::FileMap& files, const std::string& directory) {
  return files.lower_bound(directory == "/" ? directory : directory + "/");
}

} // namespace

RootFs::RootFs(FileMap files) {
  for (auto& [path, content] : files) files_[util::NormalizeContainerPath(path)] = std::move(content);
}

void RootFs::Apply(const model::FsDelta& delta) {
  for (const auto& path : delta.removals) Remove(path);
  for (const auto& [path, content] : delta.upserts) Write(path, content);
}

model::FsDelta RootFs::Diff(const RootFs& before, const RootFs& after) {
  model::FsDelta delta;
  for (const auto& [path, content] : before.files_) {
    if (!after.files_.count(path)) delta.removals.insert(path);
  }
  for (const auto& [path, content] : after.files_) {
    auto it = before.files_.find(path);
    if (it == before.files_.end() || it->second != content) delta.upserts.emplace(path, content);
  }
  return delta;
}

std::optional<std::string> RootFs::Read(std::string_view path) const {
  auto it = files_.find(util::NormalizeContainerPath(path));
  if (it == files_.end()) return std::nullopt;
  return it->second;
}

void RootFs::Write(std::string_view path, std::string content) {
  const auto normalized = util::NormalizeContainerPath(path);
  // a file replaces a directory of the same name
  if (IsDirectory(normalized)) Remove(normalized);
  files_[normalized] = std::move(content);
}

bool RootFs::Remove(std::string_view path) {
  const auto normalized = util::NormalizeContainerPath(path);
  bool       removed    = files_.erase(normalized) > 0;

  auto it = ChildrenBegin(files_, normalized);
  while (it != files_.end() && util::IsWithin(it->first, normalized)) {
    it      = files_.erase(it);
    removed = true;
  }
  return removed;
}

bool RootFs::Exists(std::string_view path) const {
  const auto normalized = util::NormalizeContainerPath(path);
  return files_.count(normalized) > 0 || IsDirectory(normalized);
}

bool RootFs::IsDirectory(std::string_view path) const {
  const auto normalized = util::NormalizeContainerPath(path);
  if (normalized == "/") return true;

  auto it = ChildrenBegin(files_, normalized);
  return it != files_.end() && util::IsWithin(it->first, normalized);
}

std::vector<std::string> RootFs::List(std::string_view directory) const {
  const auto            normalized = util::NormalizeContainerPath(directory);
  std::set<std::string> children;

  for (auto it = ChildrenBegin(files_, normalized); it != files_.end() && util::IsWithin(it->first, normalized); ++it) {
    const auto relative = util::RelativeTo(it->first, normalized);
    children.insert(relative.substr(0, relative.find('/')));
  }
  return {children.begin(), children.end()};
}

RootFs::FileMap RootFs::Subtree(std::string_view prefix) const {
  const auto normalized = util::NormalizeContainerPath(prefix);
  FileMap    out;

  for (auto it = ChildrenBegin(files_, normalized); it != files_.end() && util::IsWithin(it->first, normalized); ++it) {
    out.emplace(util::RelativeTo(it->first, normalized), it->second);
  }
  return out;
}

} // namespace dockyard::layer
