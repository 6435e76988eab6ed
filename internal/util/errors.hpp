#pragma once

#include <stdexcept>
#include <string>

namespace hosting::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Malformed or conflicting provisioning record. Never leaves partial state.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Certificate deletion blocked by an active distribution.
class InUse : public std::runtime_error {
 public:
  explicit InUse(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Generated artifact rejected by the proxy's own syntax check.
class ConfigInvalid : public std::runtime_error {
 public:
  explicit ConfigInvalid(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StartupError : public std::runtime_error {
 public:
  explicit StartupError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ReloadError : public std::runtime_error {
 public:
  explicit ReloadError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Forwarded operation (e.g. cache purge) failed against the proxy.
class UpstreamError : public std::runtime_error {
 public:
  explicit UpstreamError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace hosting::util
