#include "http_stream_transport.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"

#include <utility>

namespace {
constexpr auto CONNECT_WAIT = std::chrono::seconds(5);
} // namespace

HttpStreamTransport::HttpStreamTransport(std::string server_url,
                                         std::string stream_path)
    : server_url_(std::move(server_url)), stream_path_(std::move(stream_path)) {}

HttpStreamTransport::~HttpStreamTransport() { close(); }

void HttpStreamTransport::connect() {
  close();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
    partial_line_.clear();
    ended_ = false;
    end_reason_.clear();
  }
  closing_ = false;
  subscriber_id_ = 0;

  stream_client_ = std::make_unique<httplib::Client>(server_url_);
  stream_client_->set_connection_timeout(5);
  stream_client_->set_read_timeout(3600);
  reader_thread_ = std::thread(&HttpStreamTransport::reader_loop, this);

  // The server always opens with a `connected` event
  std::unique_lock<std::mutex> lock(mutex_);
  bool ready = cond_.wait_for(lock, CONNECT_WAIT,
                              [this] { return !lines_.empty() || ended_; });
  if (!ready || lines_.empty()) {
    std::string reason = ended_ ? end_reason_ : "no connected event received";
    lock.unlock();
    close();
    throw TransientTransportError("stream connect to " + server_url_ +
                                  " failed: " + reason);
  }
}

void HttpStreamTransport::reader_loop() {
  auto result = stream_client_->Get(
      stream_path_, [this](const char *data, size_t length) {
        if (closing_)
          return false;
        append_chunk(data, length);
        return true;
      });

  std::lock_guard<std::mutex> lock(mutex_);
  ended_ = true;
  if (!result)
    end_reason_ = httplib::to_string(result.error());
  else if (result->status != 200)
    end_reason_ = "HTTP status " + std::to_string(result->status);
  else
    end_reason_ = "stream closed by server";
  cond_.notify_all();
}

void HttpStreamTransport::append_chunk(const char *data, size_t length) {
  std::lock_guard<std::mutex> lock(mutex_);
  partial_line_.append(data, length);
  size_t newline;
  while ((newline = partial_line_.find('\n')) != std::string::npos) {
    std::string line = partial_line_.substr(0, newline);
    partial_line_.erase(0, newline + 1);
    if (line.empty())
      continue;

    if (subscriber_id_ == 0) {
      auto envelope = nlohmann::json::parse(line, nullptr, false);
      if (envelope.is_object() && envelope.value("type", "") == "connected" &&
          envelope.contains("data") && envelope["data"].is_object())
        subscriber_id_ = envelope["data"].value("subscriber_id", uint64_t{0});
    }
    lines_.push_back(std::move(line));
  }
  cond_.notify_all();
}

std::optional<std::string>
HttpStreamTransport::read_line(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cond_.wait_for(lock, timeout, [this] { return !lines_.empty() || ended_; });
  if (!lines_.empty()) {
    std::string line = std::move(lines_.front());
    lines_.pop_front();
    return line;
  }
  if (ended_)
    throw TransientTransportError(end_reason_);
  return std::nullopt;
}

void HttpStreamTransport::send(const std::string &message) {
  uint64_t id = subscriber_id_.load();
  if (id == 0)
    throw TransientTransportError("stream has no subscriber id yet");

  httplib::Client client(server_url_);
  client.set_connection_timeout(5);
  auto result = client.Post(stream_path_ + "/" + std::to_string(id) +
                                "/messages",
                            message, "application/json");
  if (!result)
    throw TransientTransportError("send failed: " +
                                  httplib::to_string(result.error()));
  if (result->status >= 300)
    throw TransientTransportError("send rejected with HTTP status " +
                                  std::to_string(result->status));
}

void HttpStreamTransport::close() {
  closing_ = true;
  if (stream_client_)
    stream_client_->stop();
  if (reader_thread_.joinable())
    reader_thread_.join();
  stream_client_.reset();
}
