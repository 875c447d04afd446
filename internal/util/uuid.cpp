#include "uuid.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace codeintel::util {

namespace {

std::mt19937_64& Rng() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

} // namespace

UUID GenerateUUID() {
  auto& rng = Rng();

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToHex(const UUID& id) {
  std::ostringstream oss;
  for (auto b : id)
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
  return oss.str();
}

std::string RandomHex(std::size_t length) {
  static constexpr char kHex[] = "0123456789abcdef";

  auto&       rng = Rng();
  std::string out;
  out.reserve(length);
  for (std::size_t i = 0; i < length; ++i)
    out.push_back(kHex[rng() & 0x0F]);
  return out;
}

} // namespace codeintel::util
