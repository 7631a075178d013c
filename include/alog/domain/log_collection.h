#pragma once

#include "alog/domain/log_record.h"

#include <cstddef>
#include <map>
#include <vector>

namespace alog::domain {

// LogCollection is the in-memory result of a search: records keyed by id,
// iterated in the order they were added. The collection owns its records.
class LogCollection {
 public:
  using const_iterator = std::vector<LogRecord>::const_iterator;

  // Append a record. A record whose id is already present replaces the stored
  // record in place and keeps its original position.
  void add(LogRecord record);

  [[nodiscard]] const LogRecord* get(const core::BinaryId& id) const;
  [[nodiscard]] bool contains(const core::BinaryId& id) const;

  [[nodiscard]] std::size_t size() const { return records_.size(); }
  [[nodiscard]] bool empty() const { return records_.empty(); }

  [[nodiscard]] const_iterator begin() const { return records_.begin(); }
  [[nodiscard]] const_iterator end() const { return records_.end(); }

  [[nodiscard]] const LogRecord& at(std::size_t position) const { return records_.at(position); }

  // Ids in iteration order.
  [[nodiscard]] std::vector<core::BinaryId> ids() const;

 private:
  std::vector<LogRecord> records_;
  std::map<core::BinaryId, std::size_t> index_;
};

}  // namespace alog::domain
