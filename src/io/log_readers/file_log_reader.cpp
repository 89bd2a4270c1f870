#include "file_log_reader.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/scoped_timer.hpp"
#include "utils/utils.hpp"

#include <stdexcept>
#include <string>
#include <vector>

FileLogReader::FileLogReader(const std::string &filepath)
    : filepath_(filepath) {
  log_file_stream_.open(filepath);
  if (!is_open()) {
    LOG(LogLevel::FATAL, LogComponent::IO_READER,
        "Failed to open observation source file: " << filepath);
    throw std::runtime_error("Failed to open observation source file: " +
                             filepath);
  }
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Successfully opened observation file: " << filepath);
}

FileLogReader::~FileLogReader() {
  if (log_file_stream_.is_open())
    log_file_stream_.close();
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "FileLogReader closed. Total lines read: "
          << line_number_ << ", rejected: " << rejected_lines_);
}

bool FileLogReader::is_open() const { return log_file_stream_.is_open(); }

std::vector<RawObservation> FileLogReader::get_next_batch() {
  static prometheus::Histogram &batch_fetch_timer =
      MetricsRegistry::instance().create_histogram(
          "tm_reader_batch_fetch_duration_seconds",
          "Latency of fetching a batch from the observation file",
          {0.0001, 0.001, 0.01, 0.1, 1.0});
  ScopedTimer timer(batch_fetch_timer);

  std::vector<RawObservation> batch;
  if (!is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "Observation file is not open. Cannot read next batch.");
    return batch;
  }

  batch.reserve(BATCH_SIZE);
  std::string line;

  while (batch.size() < BATCH_SIZE && std::getline(log_file_stream_, line)) {
    if (log_file_stream_.eof()) {
      // The writer has not finished this line yet
      partial_line_ += line;
      break;
    }
    if (!partial_line_.empty()) {
      line = partial_line_ + line;
      partial_line_.clear();
    }
    Utils::trim_inplace(line);
    if (line.empty())
      continue;

    line_number_++;
    try {
      batch.push_back(
          IngestAdapter::observation_from_json(nlohmann::json::parse(line)));
    } catch (const nlohmann::json::parse_error &e) {
      rejected_lines_++;
      LOG(LogLevel::WARN, LogComponent::IO_READER,
          "Line " << line_number_ << " is not valid JSON: " << e.what());
    } catch (const ValidationError &e) {
      rejected_lines_++;
      LOG(LogLevel::WARN, LogComponent::IO_READER,
          "Line " << line_number_ << " rejected: " << e.what());
    }
  }

  if (!batch.empty())
    LOG(LogLevel::DEBUG, LogComponent::IO_READER,
        "Read " << batch.size() << " observations from file at line number "
                << line_number_);

  // Clear EOF so the next call keeps tailing the file
  if (log_file_stream_.eof())
    log_file_stream_.clear();

  return batch;
}
