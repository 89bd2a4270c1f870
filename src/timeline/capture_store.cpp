#include "capture_store.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

CaptureStore::CaptureStore(size_t max_captures)
    : max_captures_(max_captures ? max_captures : 1) {}

std::string CaptureStore::add(Waterfall waterfall) {
  StoredCapture stored;
  stored.id = "cap-" + std::to_string(next_id_.fetch_add(1));
  stored.created_at_ms = Utils::get_current_time_ms();
  stored.waterfall = std::move(waterfall);
  std::string id = stored.id;

  std::lock_guard<std::mutex> lock(mutex_);
  captures_.push_back(std::move(stored));
  while (captures_.size() > max_captures_) {
    LOG(LogLevel::DEBUG, LogComponent::TIMELINE,
        "Capture " << captures_.front().id << " evicted.");
    captures_.pop_front();
  }
  return id;
}

std::optional<Waterfall>
CaptureStore::find(const std::string &capture_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &stored : captures_)
    if (stored.id == capture_id)
      return stored.waterfall;
  return std::nullopt;
}

Waterfall CaptureStore::get(const std::string &capture_id) const {
  auto waterfall = find(capture_id);
  if (!waterfall)
    throw NotFoundError("capture " + capture_id + " not found");
  return *waterfall;
}

std::vector<std::string> CaptureStore::list_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(captures_.size());
  for (const auto &stored : captures_)
    ids.push_back(stored.id);
  return ids;
}

size_t CaptureStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return captures_.size();
}
