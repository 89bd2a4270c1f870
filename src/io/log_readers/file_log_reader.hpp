#ifndef FILE_LOG_READER_HPP
#define FILE_LOG_READER_HPP

#include "base_log_reader.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

// Tails an NDJSON file: one observation object per line. Malformed lines are
// logged and skipped.
class FileLogReader : public ILogReader {
public:
  explicit FileLogReader(const std::string &filepath);
  ~FileLogReader() override;

  std::vector<RawObservation> get_next_batch() override;
  bool is_open() const;

  uint64_t lines_read() const { return line_number_; }
  uint64_t lines_rejected() const { return rejected_lines_; }

private:
  std::string filepath_;
  std::ifstream log_file_stream_;
  std::string partial_line_; // written without its newline yet
  uint64_t line_number_ = 0;
  uint64_t rejected_lines_ = 0;
  static constexpr size_t BATCH_SIZE = 1000;
};

#endif // FILE_LOG_READER_HPP
