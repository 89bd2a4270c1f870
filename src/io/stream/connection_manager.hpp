#ifndef CONNECTION_MANAGER_HPP
#define CONNECTION_MANAGER_HPP

#include "core/config.hpp"
#include "io/stream/stream_transport.hpp"
#include "nlohmann/json.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

enum class ConnectionState { DISCONNECTED, CONNECTING, CONNECTED };

const char *connection_state_to_string(ConnectionState state);

// One decoded envelope from the live stream
struct StreamMessage {
  std::string type;
  nlohmann::json data;
};

// Client side of the live stream. Owns the transport, keeps it alive with
// pings, reconnects with exponential backoff and fans decoded messages out to
// every registered handler.
class ConnectionManager {
public:
  using Handler = std::function<void(const StreamMessage &)>;
  using StateListener = std::function<void(ConnectionState)>;

  ConnectionManager(const Config::StreamClientConfig &config,
                    std::unique_ptr<IStreamTransport> transport);
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager &) = delete;
  ConnectionManager &operator=(const ConnectionManager &) = delete;

  uint64_t subscribe(Handler handler);
  bool unsubscribe(uint64_t token);
  void set_state_listener(StateListener listener);

  void start();
  void stop();

  ConnectionState state() const { return state_.load(); }
  uint64_t reconnect_attempts() const { return reconnect_attempts_.load(); }
  uint64_t messages_received() const { return messages_received_.load(); }
  bool gave_up() const { return gave_up_.load(); }
  // Handler invocations that threw; the message still reached the others
  uint64_t handler_failures() const { return handler_failures_.load(); }

  // Delay before the next reconnect attempt; advances the backoff
  std::chrono::milliseconds next_backoff();
  void reset_backoff();

  // Parses one NDJSON line; nullopt when it is not a valid envelope
  static std::optional<StreamMessage> decode(const std::string &line);

private:
  void run_loop();
  bool try_connect();
  // Reads, pings and checks liveness until the connection fails or stop()
  void pump_connection();
  void dispatch(const StreamMessage &message);
  void set_state(ConnectionState state);
  // False when stop() interrupted the wait
  bool sleep_interruptible(std::chrono::milliseconds delay);

  Config::StreamClientConfig config_;
  std::unique_ptr<IStreamTransport> transport_;
  std::thread worker_thread_;
  std::atomic<bool> running_{false};
  std::mutex wake_mutex_;
  std::condition_variable wake_cond_;

  std::atomic<ConnectionState> state_{ConnectionState::DISCONNECTED};
  std::atomic<uint64_t> reconnect_attempts_{0};
  std::atomic<uint64_t> messages_received_{0};
  std::atomic<uint64_t> handler_failures_{0};
  std::atomic<bool> gave_up_{false};
  uint32_t consecutive_failures_ = 0;
  double current_backoff_ms_ = 0.0;

  std::mutex handlers_mutex_;
  std::map<uint64_t, Handler> handlers_;
  uint64_t next_token_ = 1;
  StateListener state_listener_;
};

#endif // CONNECTION_MANAGER_HPP
