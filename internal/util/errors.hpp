#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace tender::util {

/*
  Central error types.

  Every rejected call surfaces one of these with a human-readable reason.
  They get translated later to gRPC status codes.
*/

class Unauthorized : public std::runtime_error {
 public:
  explicit Unauthorized(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidInput : public std::runtime_error {
 public:
  explicit InvalidInput(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A time-based precondition failed (offer period still running or already over).
class DeadlineViolation : public std::runtime_error {
 public:
  explicit DeadlineViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Short label for metrics and logs: "unauthorized", "not_found", ..., "internal".
inline const char* ErrorKind(const std::exception& e) {
  if (dynamic_cast<const Unauthorized*>(&e)) return "unauthorized";
  if (dynamic_cast<const NotFound*>(&e)) return "not_found";
  if (dynamic_cast<const AlreadyExists*>(&e)) return "already_exists";
  if (dynamic_cast<const InvalidState*>(&e)) return "invalid_state";
  if (dynamic_cast<const InvalidInput*>(&e)) return "invalid_input";
  if (dynamic_cast<const DeadlineViolation*>(&e)) return "deadline_violation";
  return "internal";
}

} // namespace tender::util
