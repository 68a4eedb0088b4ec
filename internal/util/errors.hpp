#pragma once

#include <stdexcept>
#include <string>

namespace shipyard::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Missing or malformed runtime configuration. Fatal at start-up.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// No deployable directory or no compose definition at the resolved path.
class ResolutionError : public std::runtime_error {
 public:
  explicit ResolutionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Gateway unreachable, timed out or answered with a non-2xx status.
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Allowlist denial. Never retried.
class OperationBlocked : public std::runtime_error {
 public:
  explicit OperationBlocked(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A remote step ran but reported failure (git conflict, compose error).
class CommandFailed : public std::runtime_error {
 public:
  explicit CommandFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace shipyard::util
