#include "alog/cooldown/cooldown_evaluator.h"

#include <vector>

namespace alog::cooldown {

CooldownEvaluator::CooldownEvaluator(const storage::IAccessLog& log, core::IClock& clock)
    : log_(log), clock_(clock) {}

core::Result<bool, core::Error> CooldownEvaluator::cooldown(
    const std::string& scope, const std::int64_t amount, const std::int64_t period_seconds,
    const std::optional<net::IpAddress>& remote_origin,
    const std::optional<core::BinaryId>& subject_id) const {
  if (period_seconds < 0) {
    return core::fail<bool>(core::ErrorCode::kInvalidArgument,
                            "Cooldown period must not be negative");
  }

  // Sample the clock once; both axes share the same window.
  const core::UnixSeconds window_start = clock_.now_unix_seconds() - period_seconds;

  storage::LogFilter window;
  window.scopes = std::vector<std::string>{scope};
  window.created_after = window_start;

  const std::optional<net::IpAddress> origin =
      remote_origin.has_value() ? remote_origin : log_.config().default_remote_origin;
  if (origin.has_value()) {
    storage::LogFilter by_origin = window;
    by_origin.remote_origins = std::vector<net::IpAddress>{*origin};
    auto reached = limit_reached(by_origin, amount);
    if (!reached.has_value() || reached.value()) {
      return reached;
    }
  }

  if (subject_id.has_value() && !subject_id->is_nil()) {
    storage::LogFilter by_subject = window;
    by_subject.subject_ids = std::vector<core::BinaryId>{*subject_id};
    return limit_reached(by_subject, amount);
  }

  return core::Result<bool, core::Error>::ok(false);
}

core::Result<bool, core::Error> CooldownEvaluator::limit_reached(
    const storage::LogFilter& filter, const std::int64_t amount) const {
  auto count = log_.count(filter);
  if (!count.has_value()) {
    return core::Result<bool, core::Error>::err(count.error());
  }
  return core::Result<bool, core::Error>::ok(count.value() >= amount);
}

}  // namespace alog::cooldown
