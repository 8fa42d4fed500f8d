#include "uuid.hpp"

#include <cstring>
#include <random>

#include "internal/util/errors.hpp"

namespace taskgate::util {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHex[id[i] >> 4]);
    out.push_back(kHex[id[i] & 0x0F]);
  }
  return out;
}

UUID FromString(std::string_view str) {
  std::string hex;
  hex.reserve(32);

  for (char c : str) {
    if (c == '-') continue;
    if (HexNibble(c) < 0) throw InvalidArgument("invalid uuid: non-hex character");
    hex.push_back(c);
  }

  if (hex.size() != 32) throw InvalidArgument("invalid uuid: expected 32 hex chars");

  UUID id{};
  for (size_t i = 0; i < 16; ++i)
    id[i] = static_cast<uint8_t>((HexNibble(hex[2 * i]) << 4) | HexNibble(hex[2 * i + 1]));

  return id;
}

std::string ToBytes(const UUID& id) {
  return std::string(reinterpret_cast<const char*>(id.data()), id.size());
}

UUID FromBytes(std::string_view bytes) {
  if (bytes.size() != 16) throw InvalidArgument("invalid id size: expected 16 bytes, got " + std::to_string(bytes.size()));

  UUID id{};
  std::memcpy(id.data(), bytes.data(), 16);
  return id;
}

} // namespace taskgate::util
