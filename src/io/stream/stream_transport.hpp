#ifndef STREAM_TRANSPORT_HPP
#define STREAM_TRANSPORT_HPP

#include <chrono>
#include <optional>
#include <string>

// One bidirectional connection to the live event stream. Every method may
// throw TransientTransportError.
class IStreamTransport {
public:
  virtual ~IStreamTransport() = default;

  // Blocks until the stream is open or the attempt failed
  virtual void connect() = 0;

  // Next complete line. nullopt when nothing arrived within `timeout`; throws
  // once the stream has ended.
  virtual std::optional<std::string>
  read_line(std::chrono::milliseconds timeout) = 0;

  // Client to server message, e.g. {"type":"ping"}
  virtual void send(const std::string &message) = 0;

  // Idempotent; the transport may be connected again afterwards
  virtual void close() = 0;
};

#endif // STREAM_TRANSPORT_HPP
