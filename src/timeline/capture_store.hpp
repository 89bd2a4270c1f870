#ifndef CAPTURE_STORE_HPP
#define CAPTURE_STORE_HPP

#include "timeline/capture.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Reconstructed captures kept for later waterfall queries. Oldest evicted
// first once `max_captures` is reached.
class CaptureStore {
public:
  explicit CaptureStore(size_t max_captures);

  // Returns the generated capture id
  std::string add(Waterfall waterfall);

  std::optional<Waterfall> find(const std::string &capture_id) const;

  // Throws NotFoundError when the id is unknown or already evicted
  Waterfall get(const std::string &capture_id) const;

  std::vector<std::string> list_ids() const;
  size_t size() const;

private:
  struct StoredCapture {
    std::string id;
    uint64_t created_at_ms = 0;
    Waterfall waterfall;
  };

  const size_t max_captures_;
  mutable std::mutex mutex_;
  std::deque<StoredCapture> captures_;
  std::atomic<uint64_t> next_id_{1};
};

#endif // CAPTURE_STORE_HPP
