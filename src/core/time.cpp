#include "alog/core/time.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace alog::core {

std::string format_iso8601(const UnixSeconds seconds) {
  const auto time_t_value = static_cast<std::time_t>(seconds);
  std::tm utc{};
  gmtime_r(&time_t_value, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

}  // namespace alog::core
