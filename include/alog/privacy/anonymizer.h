#pragma once

#include "alog/core/binary_id.h"
#include "alog/core/id_generator.h"
#include "alog/core/result.h"
#include "alog/domain/log_collection.h"
#include "alog/storage/access_log.h"

#include <cstdint>
#include <optional>

namespace alog::privacy {

// Anonymizer scrubs identifying fields from stored records without deleting them.
class Anonymizer {
 public:
  Anonymizer(storage::IAccessLog& log, core::IIdGenerator& id_gen);

  // Replace old_id wherever it appears as subject_id or object_id.
  // When new_id is not given a fresh id is generated, so repeated calls yield
  // unrelated pseudonyms. Returns the id written.
  [[nodiscard]] core::Result<core::BinaryId, core::Error> anonymize_id(
      const core::BinaryId& old_id, const std::optional<core::BinaryId>& new_id = std::nullopt);

  // Coarsen the stored origin of each record (IPv4 /16, IPv6 /48).
  // All records are masked before anything is written: an unsupported address family
  // fails the call with no row changed. Returns the number of rows updated.
  [[nodiscard]] core::Result<std::int64_t, core::Error> anonymize_origins(
      const domain::LogCollection& records);

 private:
  storage::IAccessLog& log_;
  core::IIdGenerator& id_gen_;
};

}  // namespace alog::privacy
