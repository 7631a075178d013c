#pragma once

#include "alog/core/binary_id.h"
#include "alog/core/clock.h"
#include "alog/core/result.h"
#include "alog/net/ip_address.h"
#include "alog/storage/access_log.h"

#include <cstdint>
#include <optional>
#include <string>

namespace alog::cooldown {

// CooldownEvaluator answers "has this actor logged `amount` events of `scope`
// within the last `period` seconds?" over an IAccessLog.
//
// The origin and subject axes are counted independently; reaching the limit on
// either one puts the caller in cooldown. The evaluator only reads.
class CooldownEvaluator {
 public:
  CooldownEvaluator(const storage::IAccessLog& log, core::IClock& clock);

  // origin falls back to the store's default_remote_origin when not given.
  // A nil subject is treated as absent.
  [[nodiscard]] core::Result<bool, core::Error> cooldown(
      const std::string& scope, std::int64_t amount, std::int64_t period_seconds,
      const std::optional<net::IpAddress>& remote_origin = std::nullopt,
      const std::optional<core::BinaryId>& subject_id = std::nullopt) const;

 private:
  const storage::IAccessLog& log_;
  core::IClock& clock_;

  [[nodiscard]] core::Result<bool, core::Error> limit_reached(const storage::LogFilter& filter,
                                                              std::int64_t amount) const;
};

}  // namespace alog::cooldown
