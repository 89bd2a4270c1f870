#ifndef RECENT_STORE_HPP
#define RECENT_STORE_HPP

#include "core/log_entry.hpp"
#include "core/tunnel_detection.hpp"
#include "detection/block_rule.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

struct ProcessedRecord {
  LogEntryPtr entry;
  BlockDecision decision;
  TunnelDetectionPtr detection;
};

// Conjunction of optional conditions; an empty filter matches every record
struct RecordFilter {
  std::optional<std::string> source_ip;
  std::optional<std::string> path; // exact path
  std::optional<std::string> method;
  std::optional<int> status;
  std::optional<bool> has_tunnel;
  std::optional<uint64_t> start_ms; // inclusive
  std::optional<uint64_t> end_ms;   // inclusive

  bool matches(const ProcessedRecord &record) const;
};

// Bounded window of the most recently processed exchanges. The oldest record
// is evicted first.
class RecentStore {
public:
  explicit RecentStore(size_t max_entries);

  void add(ProcessedRecord record);

  // Newest first, only records accepted by `filter`
  std::vector<ProcessedRecord>
  list_entries(size_t limit, size_t offset,
               const RecordFilter &filter = RecordFilter{}) const;

  // Newest first; case-insensitive substring over path, query and both bodies
  std::vector<ProcessedRecord> search(const std::string &text,
                                      size_t limit) const;
  std::optional<ProcessedRecord> find(const std::string &entry_id) const;

  // Newest first, only records with a detection at or above `min_confidence`
  std::vector<TunnelDetectionPtr>
  list_detections(size_t limit, size_t offset,
                  Confidence min_confidence = Confidence::LOW) const;

  size_t size() const;
  size_t capacity() const { return max_entries_; }

private:
  const size_t max_entries_;
  mutable std::shared_mutex mutex_;
  std::deque<ProcessedRecord> records_; // oldest at the front
  std::unordered_set<std::string> ids_;
};

#endif // RECENT_STORE_HPP
