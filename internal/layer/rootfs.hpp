#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/fs_delta.hpp"

namespace dockyard::layer {

/*
  Flattened filesystem view: absolute container path -> file content.

  Directories exist implicitly while a file lives below them. Used as the
  working snapshot of a build and as the writable view of an instance.
*/
class RootFs {
 public:
  using FileMap = std::map<std::string, std::string>;

  RootFs() = default;
  explicit RootFs(FileMap files);

  void Apply(const model::FsDelta& delta);

  // Delta that turns before into after.
  static model::FsDelta Diff(const RootFs& before, const RootFs& after);

  std::optional<std::string> Read(std::string_view path) const;
  void                       Write(std::string_view path, std::string content);

  // Removes a file or a whole directory; false when nothing existed.
  bool Remove(std::string_view path);

  bool Exists(std::string_view path) const;
  bool IsDirectory(std::string_view path) const;

  // Immediate children of a directory, sorted.
  std::vector<std::string> List(std::string_view directory) const;

  // Files below directory, keyed relative to it.
  FileMap Subtree(std::string_view prefix) const;

  const FileMap& files() const {
    return files_;
  }

 private:
  FileMap files_;
};

} // namespace dockyard::layer
