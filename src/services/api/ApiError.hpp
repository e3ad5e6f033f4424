#pragma once
#include <stdexcept>
#include <string>

namespace jds {

enum class ErrorKind {
  BadRequest,
  Forbidden,
  NotFound,
  MethodNotAllowed,
  Internal
};

inline int httpStatus(ErrorKind k) {
  switch (k) {
    case ErrorKind::BadRequest:       return 400;
    case ErrorKind::Forbidden:        return 403;
    case ErrorKind::NotFound:         return 404;
    case ErrorKind::MethodNotAllowed: return 405;
    case ErrorKind::Internal:         return 500;
  }
  return 500;
}

// Thrown inside the request handler and turned into {"error": ...}.
class ApiError : public std::runtime_error {
public:
  ApiError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }
  int status() const { return httpStatus(kind_); }

private:
  ErrorKind kind_;
};

} // namespace jds
