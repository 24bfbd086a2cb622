#pragma once

#include <cstdint>
#include <string_view>

namespace dockyard::model {

enum class InstanceState : std::uint8_t {
  kPlanned  = 0,
  kBuilding = 1,
  kCreated  = 2,
  kRunning  = 3,
  kStopped  = 4,
  kRemoved  = 5,
  kFailed   = 6,
};

constexpr bool IsTerminal(InstanceState state) {
  return state == InstanceState::kRemoved || state == InstanceState::kFailed;
}

/*
  Planned -> Building -> Created -> Running <-> Stopped -> Removed

  Building is skipped for image-only services and for reused images.
  Failed is reachable from every state before Running.
*/
constexpr bool CanTransition(InstanceState from, InstanceState to) {
  if (IsTerminal(from)) {
    return false;
  }

  switch (from) {
    case InstanceState::kPlanned:
      return to == InstanceState::kBuilding || to == InstanceState::kCreated || to == InstanceState::kFailed;
    case InstanceState::kBuilding:
      return to == InstanceState::kCreated || to == InstanceState::kFailed;
    case InstanceState::kCreated:
      return to == InstanceState::kRunning || to == InstanceState::kRemoved || to == InstanceState::kFailed;
    case InstanceState::kRunning:
      return to == InstanceState::kStopped;
    case InstanceState::kStopped:
      return to == InstanceState::kRunning || to == InstanceState::kRemoved;
    default:
      return false;
  }
}

constexpr std::string_view ToString(InstanceState state) {
  switch (state) {
    case InstanceState::kPlanned:
      return "planned";
    case InstanceState::kBuilding:
      return "building";
    case InstanceState::kCreated:
      return "created";
    case InstanceState::kRunning:
      return "running";
    case InstanceState::kStopped:
      return "stopped";
    case InstanceState::kRemoved:
      return "removed";
    case InstanceState::kFailed:
      return "failed";
  }
  return "unknown";
}

} // namespace dockyard::model
