#include "file_dispatcher.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <string>

FileDispatcher::FileDispatcher(const std::string &file_path)
    : alert_file_output_path_(file_path) {
  if (alert_file_output_path_.empty())
    return;

  if (!Utils::create_directory_for_file(alert_file_output_path_))
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "FileDispatcher could not create directory for: "
            << alert_file_output_path_);
  alert_file_stream_.open(alert_file_output_path_, std::ios::app);
  if (!alert_file_stream_.is_open())
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "FileDispatcher could not open alert output file: "
            << alert_file_output_path_);
}

FileDispatcher::~FileDispatcher() {
  if (alert_file_stream_.is_open()) {
    alert_file_stream_.flush();
    alert_file_stream_.close();
    LOG(LogLevel::TRACE, LogComponent::IO_DISPATCH,
        "FileDispatcher closed alert output file: " << alert_file_output_path_);
  }
}

bool FileDispatcher::dispatch(const TunnelDetection &detection) {
  std::lock_guard<std::mutex> lock(stream_mutex_);
  if (!alert_file_stream_.is_open())
    return false;

  std::string json_output = JsonFormatter::format_detection_line(detection);
  alert_file_stream_ << json_output << std::endl; // endl also flushes

  if (!alert_file_stream_.good()) {
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "Failed to write alert to file: " << alert_file_output_path_);
    return false;
  }
  LOG(LogLevel::TRACE, LogComponent::IO_DISPATCH,
      "Alert " << detection.detection_id
               << " dispatched to file: " << alert_file_output_path_);
  return true;
}
