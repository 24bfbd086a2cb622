#include "path.hpp"

#include <stdexcept>

namespace dockyard::util {

namespace {

std::vector<std::string> Split(std::string_view path) {
  std::vector<std::string> parts;
  std::size_t              start = 0;
  while (start <= path.size()) {
    auto end = path.find('/', start);
    if (end == std::string_view::npos) end = path.size();
    if (end > start) parts.emplace_back(path.substr(start, end - start));
    start = end + 1;
  }
  return parts;
}

std::vector<std::string> Collapse(const std::vector<std::string>& parts, std::string_view original) {
  std::vector<std::string> out;
  for (const auto& part : parts) {
    if (part == ".") continue;
    if (part == "..") {
      if (out.empty()) throw std::invalid_argument("path escapes root: " + std::string(original));
      out.pop_back();
      continue;
    }
    out.push_back(part);
  }
  return out;
}

} // namespace

std::string NormalizeContainerPath(std::string_view path) {
  if (path.empty()) throw std::invalid_argument("container path must not be empty");

  const auto parts = Collapse(Split(path), path);
  if (parts.empty()) return "/";

  std::string result;
  for (const auto& part : parts) {
    result += '/';
    result += part;
  }
  return result;
}

std::string JoinContainerPath(std::string_view base, std::string_view path) {
  if (!path.empty() && path.front() == '/') return NormalizeContainerPath(path);
  std::string joined(base.empty() ? "/" : base);
  joined += '/';
  joined += path;
  return NormalizeContainerPath(joined);
}

std::vector<std::string> PathSegments(std::string_view normalized) {
  return Split(normalized);
}

std::size_t PathDepth(std::string_view normalized) {
  return Split(normalized).size();
}

bool IsWithin(std::string_view path, std::string_view prefix) {
  if (prefix == "/") return !path.empty() && path.front() == '/';
  if (path.size() < prefix.size()) return false;
  if (path.compare(0, prefix.size(), prefix) != 0) return false;
  return path.size() == prefix.size() || path[prefix.size()] == '/';
}

std::string RelativeTo(std::string_view path, std::string_view prefix) {
  if (!IsWithin(path, prefix)) {
    throw std::invalid_argument(std::string(path) + " is not within " + std::string(prefix));
  }
  if (path.size() == prefix.size()) return {};
  if (prefix == "/") return std::string(path.substr(1));
  return std::string(path.substr(prefix.size() + 1));
}

std::string BaseName(std::string_view normalized) {
  const auto pos = normalized.rfind('/');
  if (pos == std::string_view::npos) return std::string(normalized);
  return std::string(normalized.substr(pos + 1));
}

std::string NormalizeRelativePath(std::string_view path) {
  const auto  parts = Collapse(Split(path), path);
  std::string result;
  for (const auto& part : parts) {
    if (!result.empty()) result += '/';
    result += part;
  }
  return result;
}

} // namespace dockyard::util
