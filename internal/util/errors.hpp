#pragma once

#include <stdexcept>
#include <string>

namespace dockyard::util {

/*
  Central error types.

  Components throw these; the orchestrator translates them into
  per-service outcomes so one failing service never aborts a whole up.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Missing base image, missing copy source, nonzero run status.
class BuildError : public std::runtime_error {
 public:
  explicit BuildError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class BuildCancelled : public BuildError {
 public:
  explicit BuildCancelled(const std::string& msg) : BuildError(msg) {
  }
};

class MountConflictError : public std::runtime_error {
 public:
  explicit MountConflictError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NetworkAddressExhausted : public std::runtime_error {
 public:
  explicit NetworkAddressExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResolveNotFound : public std::runtime_error {
 public:
  explicit ResolveNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Timeout : public std::runtime_error {
 public:
  explicit Timeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PortConflict : public std::runtime_error {
 public:
  explicit PortConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace dockyard::util
