#include "alog/core/id_generator.h"

#include <cstdint>

namespace alog::core {

RandomIdGenerator::RandomIdGenerator() {
  std::random_device device;
  std::seed_seq seed{device(), device(), device(), device(), device(), device(), device(),
                     device()};
  engine_.seed(seed);
}

BinaryId RandomIdGenerator::next() {
  BinaryId id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::uint64_t hi = engine_();
    const std::uint64_t lo = engine_();
    for (int i = 0; i < 8; ++i) {
      id.bytes[i] = static_cast<std::uint8_t>(hi >> (56 - 8 * i));
      id.bytes[8 + i] = static_cast<std::uint8_t>(lo >> (56 - 8 * i));
    }
  }
  // Version 4, RFC 4122 variant. Both fixed bit patterns keep the id non-nil.
  id.bytes[6] = static_cast<std::uint8_t>((id.bytes[6] & 0x0FU) | 0x40U);
  id.bytes[8] = static_cast<std::uint8_t>((id.bytes[8] & 0x3FU) | 0x80U);
  return id;
}

BinaryId DeterministicIdGenerator::next() {
  // Deterministic: big-endian counter in the low 8 bytes
  const auto c = counter_.fetch_add(1, std::memory_order_relaxed) + 1;
  BinaryId id;
  for (int i = 0; i < 8; ++i) {
    id.bytes[8 + i] = static_cast<std::uint8_t>(c >> (56 - 8 * i));
  }
  return id;
}

}  // namespace alog::core
