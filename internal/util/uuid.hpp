#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace workledger::util {

/*
  UUID helpers

  Job and transaction ids are RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Canonical 36-char text form of a fresh id.
std::string NewId();

} // namespace workledger::util
