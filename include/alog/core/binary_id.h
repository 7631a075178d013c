#pragma once

#include "alog/core/result.h"
#include "alog/core/types.h"

#include <string>
#include <string_view>

namespace alog::core {

// BinaryId is the canonical 128-bit identifier used for log ids and for subject/object ids.
// The all-zero value is the "none" sentinel.
//
// Text forms accepted by parse():
// - ""                                       -> nil id
// - 22 characters of unpadded base64url      (canonical form, what to_string() produces)
// - 32 hex digits
// - 36 character dashed UUID (8-4-4-4-12 hex)
struct BinaryId {
  Bytes16 bytes{};

  [[nodiscard]] static Result<BinaryId, Error> parse(std::string_view text);

  // Wraps raw storage bytes. Fails unless exactly 16 bytes are given.
  [[nodiscard]] static Result<BinaryId, Error> from_bytes(const void* data, std::size_t size);

  [[nodiscard]] bool is_nil() const;

  // Canonical base64url text; empty for the nil id.
  [[nodiscard]] std::string to_string() const;

  // Lowercase dashed UUID text (for diagnostics).
  [[nodiscard]] std::string to_uuid_string() const;

  auto operator<=>(const BinaryId&) const = default;
};

}  // namespace alog::core
