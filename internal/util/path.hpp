#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace dockyard::util {

/*
  Container path helpers.

  Container paths are always absolute, '/'-separated and normalized:
  no empty, "." or ".." segments and no trailing slash (except "/").
  All comparisons are segment-wise, so "/app" never covers "/apple".
*/

// Throws std::invalid_argument for paths escaping the root.
std::string NormalizeContainerPath(std::string_view path);

// Relative paths are resolved against base.
std::string JoinContainerPath(std::string_view base, std::string_view path);

std::vector<std::string> PathSegments(std::string_view normalized);
std::size_t              PathDepth(std::string_view normalized);

// True when path equals prefix or lies below it.
bool IsWithin(std::string_view path, std::string_view prefix);

// Path of `path` relative to `prefix` ("" when equal). Requires IsWithin.
std::string RelativeTo(std::string_view path, std::string_view prefix);

std::string BaseName(std::string_view normalized);

// Relative build-context path: '/'-separated, no leading slash, no "..".
std::string NormalizeRelativePath(std::string_view path);

} // namespace dockyard::util
