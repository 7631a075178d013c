#include "alog/storage/inmemory_access_log.h"

#include <algorithm>
#include <iterator>
#include <utility>

namespace alog::storage {

InMemoryAccessLog::InMemoryAccessLog(AccessLogConfig config, core::IIdGenerator& id_gen,
                                     core::IClock& clock)
    : config_(std::move(config)), id_gen_(id_gen), clock_(clock) {}

core::Result<domain::LogRecord, core::Error> InMemoryAccessLog::create(
    const NewLogRecord& fields) {
  auto candidate = build_candidate(fields, config_, id_gen_, clock_);
  if (!candidate.has_value()) {
    return candidate;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const auto& record = candidate.value();
  const bool exists = std::any_of(rows_.begin(), rows_.end(),
                                  [&record](const domain::LogRecord& row) {
                                    return row.id == record.id;
                                  });
  if (exists) {
    return core::fail<domain::LogRecord>(core::ErrorCode::kCollision,
                                         "Log ID collision: " + record.id.to_string());
  }
  rows_.push_back(record);
  return candidate;
}

core::Result<std::optional<domain::LogRecord>, core::Error> InMemoryAccessLog::get(
    const core::BinaryId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& row : rows_) {
    if (row.id == id) {
      return core::Result<std::optional<domain::LogRecord>, core::Error>::ok(row);
    }
  }
  return core::Result<std::optional<domain::LogRecord>, core::Error>::ok(std::nullopt);
}

core::Result<std::int64_t, core::Error> InMemoryAccessLog::count(const LogFilter& filter) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto n = std::count_if(rows_.begin(), rows_.end(), [&filter](const domain::LogRecord& row) {
    return matches(filter, row);
  });
  return core::Result<std::int64_t, core::Error>::ok(static_cast<std::int64_t>(n));
}

core::Result<domain::LogCollection, core::Error> InMemoryAccessLog::search(
    const LogFilter& filter, const SortSpec& sort, const PageSpec& page) const {
  std::vector<domain::LogRecord> selected;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::copy_if(rows_.begin(), rows_.end(), std::back_inserter(selected),
                 [&filter](const domain::LogRecord& row) { return matches(filter, row); });
  }

  std::sort(selected.begin(), selected.end(),
            [&sort](const domain::LogRecord& a, const domain::LogRecord& b) {
              return ordered_before(sort, a, b);
            });

  std::size_t first = 0;
  std::size_t last = selected.size();
  if (page.paginated()) {
    const std::size_t page_size = *page.page_size;
    const std::size_t page_count =
        selected.size() / page_size + (selected.size() % page_size != 0 ? 1 : 0);
    if (page.page >= page_count) {
      first = last;
    } else {
      first = page.page * page_size;
      last = first + std::min(page_size, selected.size() - first);
    }
  }

  domain::LogCollection result;
  for (std::size_t i = first; i < last; ++i) {
    result.add(std::move(selected[i]));
  }
  return core::Result<domain::LogCollection, core::Error>::ok(std::move(result));
}

core::Result<bool, core::Error> InMemoryAccessLog::remove(const core::BinaryId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto before = rows_.size();
  std::erase_if(rows_, [&id](const domain::LogRecord& row) { return row.id == id; });
  return core::Result<bool, core::Error>::ok(rows_.size() != before);
}

core::Result<std::int64_t, core::Error> InMemoryAccessLog::prune(
    std::optional<core::UnixSeconds> created_before) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto removed = std::erase_if(rows_, [&created_before](const domain::LogRecord& row) {
    // creation_time 0 marks an undated row and is never pruned.
    if (row.creation_time == 0) {
      return false;
    }
    return !created_before.has_value() || row.creation_time < *created_before;
  });
  return core::Result<std::int64_t, core::Error>::ok(static_cast<std::int64_t>(removed));
}

core::Result<std::set<std::string>, core::Error> InMemoryAccessLog::unique_scopes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<std::string> scopes;
  for (const auto& row : rows_) {
    scopes.insert(row.scope);
  }
  return core::Result<std::set<std::string>, core::Error>::ok(std::move(scopes));
}

core::Result<std::int64_t, core::Error> InMemoryAccessLog::replace_party_id(
    const core::BinaryId& old_id, const core::BinaryId& new_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::int64_t rewritten = 0;
  for (auto& row : rows_) {
    if (row.subject_id == old_id) {
      row.subject_id = new_id;
      ++rewritten;
    }
  }
  for (auto& row : rows_) {
    if (row.object_id == old_id) {
      row.object_id = new_id;
      ++rewritten;
    }
  }
  return core::Result<std::int64_t, core::Error>::ok(rewritten);
}

core::Result<std::int64_t, core::Error> InMemoryAccessLog::update_remote_origins(
    const std::vector<OriginUpdate>& updates) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::int64_t updated = 0;
  for (const auto& update : updates) {
    for (auto& row : rows_) {
      if (row.id == update.id) {
        row.remote_origin = update.remote_origin;
        ++updated;
      }
    }
  }
  return core::Result<std::int64_t, core::Error>::ok(updated);
}

}  // namespace alog::storage
