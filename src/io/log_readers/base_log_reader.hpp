#ifndef BASE_LOG_READER_HPP
#define BASE_LOG_READER_HPP

#include "io/ingest/ingest_adapter.hpp"

#include <vector>

class ILogReader {
public:
  virtual ~ILogReader() = default;

  // Fetches the next batch of observations. Returns an empty vector when
  // nothing new is available yet.
  virtual std::vector<RawObservation> get_next_batch() = 0;
};

#endif // BASE_LOG_READER_HPP
