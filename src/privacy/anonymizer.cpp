#include "alog/privacy/anonymizer.h"

#include "alog/net/ip_address.h"

#include <vector>

namespace alog::privacy {

Anonymizer::Anonymizer(storage::IAccessLog& log, core::IIdGenerator& id_gen)
    : log_(log), id_gen_(id_gen) {}

core::Result<core::BinaryId, core::Error> Anonymizer::anonymize_id(
    const core::BinaryId& old_id, const std::optional<core::BinaryId>& new_id) {
  const core::BinaryId replacement = new_id.has_value() ? *new_id : id_gen_.next();

  auto rewritten = log_.replace_party_id(old_id, replacement);
  if (!rewritten.has_value()) {
    return core::Result<core::BinaryId, core::Error>::err(rewritten.error());
  }
  return core::Result<core::BinaryId, core::Error>::ok(replacement);
}

core::Result<std::int64_t, core::Error> Anonymizer::anonymize_origins(
    const domain::LogCollection& records) {
  std::vector<storage::OriginUpdate> updates;
  updates.reserve(records.size());

  for (const auto& record : records) {
    auto masked = net::anonymize(record.remote_origin);
    if (!masked.has_value()) {
      return core::fail<std::int64_t>(masked.error().code, "Cannot anonymize origin of log " +
                                                               record.id.to_string() + ": " +
                                                               masked.error().message);
    }
    updates.push_back(storage::OriginUpdate{record.id, masked.value()});
  }

  return log_.update_remote_origins(updates);
}

}  // namespace alog::privacy
