#ifndef IP_RATE_ARENA_HPP
#define IP_RATE_ARENA_HPP

#include <cstddef>
#include <cstdint>
#include <list>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

struct IpSample {
  uint64_t timestamp_ms = 0;
  uint64_t request_bytes = 0;
  uint64_t response_bytes = 0;
};

// Read-only view over one IP's ring, oldest sample first. Only valid until the
// owning arena is modified again.
class IpHistoryView {
public:
  IpHistoryView() = default;
  IpHistoryView(const IpSample *ring, size_t ring_size, size_t head,
                size_t count)
      : ring_(ring), ring_size_(ring_size), head_(head), count_(count) {}

  size_t size() const { return count_; }
  bool empty() const { return count_ == 0; }

  const IpSample &at(size_t i) const {
    return ring_[(head_ + ring_size_ - count_ + i) % ring_size_];
  }
  const IpSample &latest() const { return at(count_ - 1); }

  // Number of samples with timestamp >= cutoff_ms
  size_t count_since(uint64_t cutoff_ms) const;

private:
  const IpSample *ring_ = nullptr;
  size_t ring_size_ = 0;
  size_t head_ = 0; // next write position
  size_t count_ = 0;
};

// Fixed pool of fixed-size ring buffers keyed by IP. When every slot is in use
// the least recently touched IP is evicted. Not thread-safe: each partition
// worker owns its own arena.
class IpRateArena {
public:
  IpRateArena(size_t capacity, size_t ring_size);

  IpHistoryView record(const std::string &ip, const IpSample &sample);
  IpHistoryView find(const std::string &ip) const;

  size_t tracked_ips() const { return index_.size(); }
  size_t capacity() const { return slots_.size(); }
  size_t ring_size() const { return ring_size_; }
  uint64_t evictions() const { return evictions_; }

private:
  struct Slot {
    std::string ip;
    size_t head = 0;
    size_t count = 0;
    std::list<size_t>::iterator lru_position;
  };

  size_t acquire_slot(const std::string &ip);
  IpHistoryView view_of(size_t slot_index) const;

  size_t ring_size_;
  std::vector<IpSample> samples_; // slots_.size() * ring_size_ contiguous
  std::vector<Slot> slots_;
  std::unordered_map<std::string, size_t> index_;
  std::list<size_t> lru_; // front is the most recently used slot
  std::vector<size_t> free_slots_;
  uint64_t evictions_ = 0;
};

#endif // IP_RATE_ARENA_HPP
