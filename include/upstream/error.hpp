#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace upstream {

enum class FailureOrigin { Transport, Decode, Status, Cancelled };

inline const char* to_string(FailureOrigin origin) {
  switch (origin) {
    case FailureOrigin::Transport:
      return "transport";
    case FailureOrigin::Decode:
      return "decode";
    case FailureOrigin::Status:
      return "status";
    case FailureOrigin::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

class UpstreamError : public std::runtime_error {
public:
  explicit UpstreamError(const std::string& message)
      : std::runtime_error(message) {}
};

/**
 * Failure of a logical upstream call. Carries enough of the last attempt's
 * outcome (origin, status, body, cause) for callers to branch on it without
 * re-parsing the message.
 */
class RequestError : public UpstreamError {
public:
  RequestError(std::string message,
               FailureOrigin origin,
               std::optional<long> status_code,
               std::string body,
               std::string cause,
               std::size_t attempts)
      : UpstreamError(std::move(message)),
        origin_(origin),
        status_code_(status_code),
        body_(std::move(body)),
        cause_(std::move(cause)),
        attempts_(attempts) {}

  FailureOrigin origin() const { return origin_; }
  const std::optional<long>& status_code() const { return status_code_; }
  const std::string& body() const { return body_; }
  const std::string& cause() const { return cause_; }
  std::size_t attempts() const { return attempts_; }

private:
  FailureOrigin origin_;
  std::optional<long> status_code_;
  std::string body_;
  std::string cause_;
  std::size_t attempts_;
};

class TransportError : public RequestError {
public:
  explicit TransportError(const std::string& message)
      : RequestError(message, FailureOrigin::Transport, std::nullopt, {}, message, 0) {}

  TransportError(std::string message, std::string cause, std::size_t attempts)
      : RequestError(std::move(message), FailureOrigin::Transport, std::nullopt, {}, std::move(cause), attempts) {}
};

class TransportTimeoutError : public TransportError {
public:
  using TransportError::TransportError;
};

// The peer answered but the body could not be read to completion.
class DecodeError : public RequestError {
public:
  explicit DecodeError(const std::string& message, std::optional<long> status_code = std::nullopt)
      : RequestError(message, FailureOrigin::Decode, status_code, {}, message, 0) {}

  DecodeError(std::string message, std::optional<long> status_code, std::string cause, std::size_t attempts)
      : RequestError(std::move(message), FailureOrigin::Decode, status_code, {}, std::move(cause), attempts) {}
};

class StatusError : public RequestError {
public:
  StatusError(std::string message,
              long status_code,
              std::string body,
              std::map<std::string, std::string> headers,
              std::size_t attempts)
      : RequestError(std::move(message),
                     FailureOrigin::Status,
                     status_code,
                     std::move(body),
                     "HTTP " + std::to_string(status_code),
                     attempts),
        headers_(std::move(headers)) {}

  const std::map<std::string, std::string>& headers() const { return headers_; }

private:
  std::map<std::string, std::string> headers_;
};

class CancelledError : public RequestError {
public:
  explicit CancelledError(const std::string& message, std::size_t attempts = 0)
      : RequestError(message, FailureOrigin::Cancelled, std::nullopt, {}, message, attempts) {}
};

class DeadlineExceededError : public CancelledError {
public:
  using CancelledError::CancelledError;
};

/**
 * Every attempt failed with a retryable outcome. origin(), status_code(),
 * body() and cause() describe the last attempt.
 */
class RetriesExhaustedError : public RequestError {
public:
  using RequestError::RequestError;
};

}  // namespace upstream
