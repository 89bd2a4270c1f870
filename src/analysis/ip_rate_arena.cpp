#include "ip_rate_arena.hpp"
#include "core/logger.hpp"

#include <algorithm>

size_t IpHistoryView::count_since(uint64_t cutoff_ms) const {
  size_t matching = 0;
  for (size_t i = count_; i > 0; --i) {
    if (at(i - 1).timestamp_ms < cutoff_ms)
      break;
    ++matching;
  }
  return matching;
}

IpRateArena::IpRateArena(size_t capacity, size_t ring_size)
    : ring_size_(std::max<size_t>(ring_size, 1)),
      samples_(std::max<size_t>(capacity, 1) * ring_size_),
      slots_(std::max<size_t>(capacity, 1)) {
  free_slots_.reserve(slots_.size());
  for (size_t i = slots_.size(); i > 0; --i)
    free_slots_.push_back(i - 1);
  index_.reserve(slots_.size());
}

size_t IpRateArena::acquire_slot(const std::string &ip) {
  size_t slot_index;
  if (!free_slots_.empty()) {
    slot_index = free_slots_.back();
    free_slots_.pop_back();
  } else {
    // Reuse the least recently used slot
    slot_index = lru_.back();
    lru_.pop_back();
    LOG(LogLevel::TRACE, LogComponent::CLASSIFIER,
        "Evicting per-IP history for " << slots_[slot_index].ip);
    index_.erase(slots_[slot_index].ip);
    evictions_++;
  }

  Slot &slot = slots_[slot_index];
  slot.ip = ip;
  slot.head = 0;
  slot.count = 0;
  lru_.push_front(slot_index);
  slot.lru_position = lru_.begin();
  index_.emplace(ip, slot_index);
  return slot_index;
}

IpHistoryView IpRateArena::record(const std::string &ip,
                                  const IpSample &sample) {
  size_t slot_index;
  auto it = index_.find(ip);
  if (it == index_.end()) {
    slot_index = acquire_slot(ip);
  } else {
    slot_index = it->second;
    lru_.splice(lru_.begin(), lru_, slots_[slot_index].lru_position);
  }

  Slot &slot = slots_[slot_index];
  samples_[slot_index * ring_size_ + slot.head] = sample;
  slot.head = (slot.head + 1) % ring_size_;
  slot.count = std::min(slot.count + 1, ring_size_);
  return view_of(slot_index);
}

IpHistoryView IpRateArena::find(const std::string &ip) const {
  auto it = index_.find(ip);
  if (it == index_.end())
    return {};
  return view_of(it->second);
}

IpHistoryView IpRateArena::view_of(size_t slot_index) const {
  const Slot &slot = slots_[slot_index];
  return IpHistoryView(&samples_[slot_index * ring_size_], ring_size_,
                       slot.head, slot.count);
}
