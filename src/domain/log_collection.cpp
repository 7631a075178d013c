#include "alog/domain/log_collection.h"

#include <utility>

namespace alog::domain {

void LogCollection::add(LogRecord record) {
  auto it = index_.find(record.id);
  if (it != index_.end()) {
    records_[it->second] = std::move(record);
    return;
  }
  index_.emplace(record.id, records_.size());
  records_.push_back(std::move(record));
}

const LogRecord* LogCollection::get(const core::BinaryId& id) const {
  auto it = index_.find(id);
  if (it == index_.end()) {
    return nullptr;
  }
  return &records_[it->second];
}

bool LogCollection::contains(const core::BinaryId& id) const {
  return index_.find(id) != index_.end();
}

std::vector<core::BinaryId> LogCollection::ids() const {
  std::vector<core::BinaryId> result;
  result.reserve(records_.size());
  for (const auto& record : records_) {
    result.push_back(record.id);
  }
  return result;
}

}  // namespace alog::domain
