#pragma once

#include <stdexcept>
#include <string>

namespace failover::util {

/*
  Central error types.

  Remote-side failures never surface as exceptions from the escape bridge;
  these cover configuration and local service errors and get translated
  to gRPC status codes at the transport edge.
*/

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ServiceUnavailable : public std::runtime_error {
 public:
  explicit ServiceUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace failover::util
