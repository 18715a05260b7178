#include "uuid.hpp"

#include <random>

namespace signage::util {

/*
  Two 64-bit draws per id; each thread owns its generator so id
  creation never contends across repositories.
*/
UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (size_t half = 0; half < 2; ++half) {
    const uint64_t bits = rng();
    for (size_t i = 0; i < 8; ++i) {
      id[half * 8 + i] = static_cast<uint8_t>(bits >> (i * 8));
    }
  }

  id[6] = static_cast<uint8_t>((id[6] & 0x0F) | 0x40);  // version 4
  id[8] = static_cast<uint8_t>((id[8] & 0x3F) | 0x80);  // RFC4122 variant
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

} // namespace signage::util
