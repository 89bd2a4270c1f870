#include "recent_store.hpp"
#include "core/errors.hpp"
#include "utils/utils.hpp"

#include <cstddef>
#include <mutex>

bool RecordFilter::matches(const ProcessedRecord &record) const {
  const LogEntry &entry = *record.entry;
  if (source_ip && entry.source_ip != *source_ip)
    return false;
  if (path && entry.path != *path)
    return false;
  if (method && !Utils::iequals(entry.method, *method))
    return false;
  if (status && entry.response_status != *status)
    return false;
  if (has_tunnel && (record.detection != nullptr) != *has_tunnel)
    return false;
  if (start_ms && entry.timestamp_ms < *start_ms)
    return false;
  if (end_ms && entry.timestamp_ms > *end_ms)
    return false;
  return true;
}

RecentStore::RecentStore(size_t max_entries)
    : max_entries_(max_entries ? max_entries : 1) {}

void RecentStore::add(ProcessedRecord record) {
  if (!record.entry)
    throw ValidationError("processed record without an entry");

  std::unique_lock<std::shared_mutex> lock(mutex_);
  ids_.insert(record.entry->id);
  records_.push_back(std::move(record));
  while (records_.size() > max_entries_) {
    ids_.erase(records_.front().entry->id);
    records_.pop_front();
  }
}

std::vector<ProcessedRecord>
RecentStore::list_entries(size_t limit, size_t offset,
                          const RecordFilter &filter) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<ProcessedRecord> page;
  size_t skipped = 0;
  for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
    if (page.size() >= limit)
      break;
    if (!filter.matches(*it))
      continue;
    if (skipped < offset) {
      ++skipped;
      continue;
    }
    page.push_back(*it);
  }
  return page;
}

std::vector<ProcessedRecord> RecentStore::search(const std::string &text,
                                                 size_t limit) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<ProcessedRecord> hits;
  for (auto it = records_.rbegin(); it != records_.rend() && hits.size() < limit;
       ++it) {
    const LogEntry &entry = *it->entry;
    if (Utils::contains_ci(entry.path, text) ||
        Utils::contains_ci(entry.query, text) ||
        Utils::contains_ci(entry.request_body.data, text) ||
        Utils::contains_ci(entry.response_body.data, text))
      hits.push_back(*it);
  }
  return hits;
}

std::optional<ProcessedRecord>
RecentStore::find(const std::string &entry_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (!ids_.count(entry_id))
    return std::nullopt;

  // Records from different partitions interleave, so scan from the newest
  for (auto it = records_.rbegin(); it != records_.rend(); ++it)
    if (it->entry->id == entry_id)
      return *it;
  return std::nullopt;
}

std::vector<TunnelDetectionPtr>
RecentStore::list_detections(size_t limit, size_t offset,
                             Confidence min_confidence) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<TunnelDetectionPtr> page;
  size_t skipped = 0;
  for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
    if (!it->detection || it->detection->confidence < min_confidence)
      continue;
    if (skipped < offset) {
      ++skipped;
      continue;
    }
    if (page.size() >= limit)
      break;
    page.push_back(it->detection);
  }
  return page;
}

size_t RecentStore::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return records_.size();
}
