#pragma once

#include <array>
#include <cstdint>

namespace alog::core {

// Fixed-width storage form shared by identifiers and network origins.
using Bytes16 = std::array<std::uint8_t, 16>;

// Seconds since the Unix epoch.
using UnixSeconds = std::int64_t;

}  // namespace alog::core
