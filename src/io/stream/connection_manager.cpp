#include "connection_manager.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <exception>
#include <vector>

namespace {
constexpr auto READ_SLICE = std::chrono::milliseconds(100);
} // namespace

const char *connection_state_to_string(ConnectionState state) {
  switch (state) {
  case ConnectionState::DISCONNECTED:
    return "disconnected";
  case ConnectionState::CONNECTING:
    return "connecting";
  case ConnectionState::CONNECTED:
    return "connected";
  }
  return "disconnected";
}

ConnectionManager::ConnectionManager(
    const Config::StreamClientConfig &config,
    std::unique_ptr<IStreamTransport> transport)
    : config_(config), transport_(std::move(transport)),
      current_backoff_ms_(static_cast<double>(config.initial_backoff_ms)) {}

ConnectionManager::~ConnectionManager() { stop(); }

uint64_t ConnectionManager::subscribe(Handler handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  uint64_t token = next_token_++;
  handlers_.emplace(token, std::move(handler));
  return token;
}

bool ConnectionManager::unsubscribe(uint64_t token) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  return handlers_.erase(token) > 0;
}

void ConnectionManager::set_state_listener(StateListener listener) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  state_listener_ = std::move(listener);
}

void ConnectionManager::start() {
  if (running_.exchange(true))
    return;
  // A loop that gave up has already finished; reap it before restarting
  if (worker_thread_.joinable())
    worker_thread_.join();
  gave_up_ = false;
  reset_backoff();
  worker_thread_ = std::thread(&ConnectionManager::run_loop, this);
}

void ConnectionManager::stop() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    if (!running_.exchange(false) && !worker_thread_.joinable())
      return;
  }
  wake_cond_.notify_all();
  if (worker_thread_.joinable())
    worker_thread_.join();
}

std::chrono::milliseconds ConnectionManager::next_backoff() {
  auto delay = static_cast<uint64_t>(std::min(
      current_backoff_ms_, static_cast<double>(config_.max_backoff_ms)));
  current_backoff_ms_ = std::min(current_backoff_ms_ * config_.backoff_multiplier,
                                 static_cast<double>(config_.max_backoff_ms));
  return std::chrono::milliseconds(delay);
}

void ConnectionManager::reset_backoff() {
  current_backoff_ms_ = static_cast<double>(config_.initial_backoff_ms);
  consecutive_failures_ = 0;
}

std::optional<StreamMessage>
ConnectionManager::decode(const std::string &line) {
  auto envelope = nlohmann::json::parse(line, nullptr, false);
  if (!envelope.is_object())
    return std::nullopt;
  auto type = envelope.find("type");
  if (type == envelope.end() || !type->is_string())
    return std::nullopt;

  StreamMessage message;
  message.type = type->get<std::string>();
  auto data = envelope.find("data");
  if (data != envelope.end())
    message.data = *data;
  return message;
}

void ConnectionManager::set_state(ConnectionState state) {
  ConnectionState previous = state_.exchange(state);
  if (previous == state)
    return;

  LOG(LogLevel::DEBUG, LogComponent::IO_STREAM,
      "Stream connection " << connection_state_to_string(previous) << " -> "
                           << connection_state_to_string(state));
  StateListener listener;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    listener = state_listener_;
  }
  if (listener)
    listener(state);
}

void ConnectionManager::dispatch(const StreamMessage &message) {
  std::vector<Handler> handlers;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers.reserve(handlers_.size());
    for (const auto &[token, handler] : handlers_)
      handlers.push_back(handler);
  }
  for (const auto &handler : handlers) {
    try {
      handler(message);
    } catch (const std::exception &e) {
      handler_failures_++;
      LOG(LogLevel::ERROR, LogComponent::IO_STREAM,
          "Handler failed on '" << message.type << "' message: " << e.what());
    }
  }
}

bool ConnectionManager::sleep_interruptible(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(wake_mutex_);
  return !wake_cond_.wait_for(lock, delay, [this] { return !running_; });
}

bool ConnectionManager::try_connect() {
  set_state(ConnectionState::CONNECTING);
  try {
    transport_->connect();
  } catch (const TransientTransportError &e) {
    LOG(LogLevel::WARN, LogComponent::IO_STREAM,
        "Connect attempt failed: " << e.what());
    set_state(ConnectionState::DISCONNECTED);
    return false;
  }
  set_state(ConnectionState::CONNECTED);
  reset_backoff();
  LOG(LogLevel::INFO, LogComponent::IO_STREAM, "Stream connected.");
  return true;
}

void ConnectionManager::pump_connection() {
  using Clock = std::chrono::steady_clock;
  const auto ping_interval = std::chrono::milliseconds(config_.ping_interval_ms);
  const auto idle_timeout = std::chrono::milliseconds(config_.idle_timeout_ms);
  auto last_traffic = Clock::now();
  auto last_ping = Clock::now();

  while (running_) {
    try {
      if (auto line = transport_->read_line(READ_SLICE)) {
        last_traffic = Clock::now();
        if (auto message = decode(*line)) {
          messages_received_++;
          dispatch(*message);
        } else {
          LOG(LogLevel::WARN, LogComponent::IO_STREAM,
              "Ignoring malformed stream line: " << *line);
        }
      }

      auto now = Clock::now();
      if (config_.ping_interval_ms > 0 && now - last_ping >= ping_interval) {
        transport_->send(R"({"type":"ping"})");
        last_ping = now;
      }
      if (config_.idle_timeout_ms > 0 && now - last_traffic >= idle_timeout) {
        LOG(LogLevel::WARN, LogComponent::IO_STREAM,
            "No stream traffic for " << config_.idle_timeout_ms
                                     << " ms, reconnecting.");
        return;
      }
    } catch (const TransientTransportError &e) {
      LOG(LogLevel::WARN, LogComponent::IO_STREAM,
          "Stream connection lost: " << e.what());
      return;
    }
  }
}

void ConnectionManager::run_loop() {
  LOG(LogLevel::INFO, LogComponent::IO_STREAM,
      "Connection manager started for " << config_.server_url
                                        << config_.stream_path);
  while (running_) {
    if (try_connect()) {
      pump_connection();
      transport_->close();
      set_state(ConnectionState::DISCONNECTED);
      if (!running_)
        break;
    } else {
      consecutive_failures_++;
    }

    if (config_.max_reconnect_attempts > 0 &&
        consecutive_failures_ >= config_.max_reconnect_attempts) {
      LOG(LogLevel::ERROR, LogComponent::IO_STREAM,
          "Giving up after " << consecutive_failures_
                             << " failed connect attempts.");
      gave_up_ = true;
      break;
    }

    auto delay = next_backoff();
    reconnect_attempts_++;
    LOG(LogLevel::INFO, LogComponent::IO_STREAM,
        "Reconnecting in " << delay.count() << " ms.");
    if (!sleep_interruptible(delay))
      break;
  }
  transport_->close();
  set_state(ConnectionState::DISCONNECTED);
  running_ = false;
}
