#ifndef HTTP_STREAM_TRANSPORT_HPP
#define HTTP_STREAM_TRANSPORT_HPP

#include "io/stream/stream_transport.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace httplib {
class Client;
}

// Chunked NDJSON over a long-lived GET. Client messages go to
// <stream_path>/<subscriber_id>/messages, the id being taken from the
// server's `connected` event.
class HttpStreamTransport : public IStreamTransport {
public:
  HttpStreamTransport(std::string server_url, std::string stream_path);
  ~HttpStreamTransport() override;

  void connect() override;
  std::optional<std::string>
  read_line(std::chrono::milliseconds timeout) override;
  void send(const std::string &message) override;
  void close() override;

  uint64_t subscriber_id() const { return subscriber_id_.load(); }

private:
  void reader_loop();
  void append_chunk(const char *data, size_t length);

  std::string server_url_;
  std::string stream_path_;
  std::unique_ptr<httplib::Client> stream_client_;
  std::thread reader_thread_;

  std::mutex mutex_;
  std::condition_variable cond_;
  std::deque<std::string> lines_;
  std::string partial_line_;
  bool ended_ = false;
  std::string end_reason_;

  std::atomic<bool> closing_{false};
  std::atomic<uint64_t> subscriber_id_{0};
};

#endif // HTTP_STREAM_TRANSPORT_HPP
