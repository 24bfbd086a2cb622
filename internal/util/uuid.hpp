#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace dockyard::util {

/*
  UUID helpers

  Instance ids and anonymous volume ids are random RFC4122 v4 UUIDs.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// 64 hex chars without dashes, the form anonymous volume names use.
std::string GenerateHexId();

} // namespace dockyard::util
