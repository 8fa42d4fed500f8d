#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace taskgate::util {

/*
  UUID helpers

  Task ids are raw 16 byte RFC4122 UUIDs on the wire.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(std::string_view str);

// raw 16 byte form as carried in protobuf `bytes` fields
std::string ToBytes(const UUID& id);
UUID        FromBytes(std::string_view bytes);

} // namespace taskgate::util
