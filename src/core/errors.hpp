#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Error codes surfaced to callers of the pull interfaces
enum class ErrorCode { NOT_FOUND, INVALID_INPUT, TRANSIENT, INTERNAL };

inline const char *error_code_to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::NOT_FOUND:
    return "not_found";
  case ErrorCode::INVALID_INPUT:
    return "invalid_input";
  case ErrorCode::TRANSIENT:
    return "transient";
  case ErrorCode::INTERNAL:
    return "internal";
  }
  return "internal";
}

inline int error_code_to_http_status(ErrorCode code) {
  switch (code) {
  case ErrorCode::NOT_FOUND:
    return 404;
  case ErrorCode::INVALID_INPUT:
    return 400;
  case ErrorCode::TRANSIENT:
    return 503;
  case ErrorCode::INTERNAL:
    return 500;
  }
  return 500;
}

class MonitorError : public std::runtime_error {
public:
  MonitorError(ErrorCode code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};

// Malformed capture entry, observation or request argument
class ValidationError : public MonitorError {
public:
  explicit ValidationError(const std::string &message)
      : MonitorError(ErrorCode::INVALID_INPUT, message) {}
};

class NotFoundError : public MonitorError {
public:
  explicit NotFoundError(const std::string &message)
      : MonitorError(ErrorCode::NOT_FOUND, message) {}
};

// A subscriber's transport failed to accept an event
class TransientTransportError : public MonitorError {
public:
  explicit TransientTransportError(const std::string &message)
      : MonitorError(ErrorCode::TRANSIENT, message) {}
};

// Internal state no longer satisfies its own invariants. Only the operation
// that detected it fails.
class InvariantViolation : public MonitorError {
public:
  explicit InvariantViolation(const std::string &message)
      : MonitorError(ErrorCode::INTERNAL, message) {}
};

#endif // ERRORS_HPP
