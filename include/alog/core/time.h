#pragma once

#include "alog/core/types.h"

#include <string>

namespace alog::core {

// Render Unix seconds as ISO 8601 UTC ("1970-01-01T00:00:00Z").
[[nodiscard]] std::string format_iso8601(UnixSeconds seconds);

}  // namespace alog::core
