#pragma once

#include <stdexcept>
#include <string>

namespace reqtrace {

// Configuration document is malformed beyond recovery.
class ConfigError : public std::invalid_argument {
public:
  explicit ConfigError(const std::string &message)
      : std::invalid_argument(message) {}
};

// A query named a rule id or spec/impl absent from the current snapshot.
class NotFoundError : public std::runtime_error {
public:
  explicit NotFoundError(const std::string &message)
      : std::runtime_error(message) {}
};

// Disk I/O failed mid-rebuild; the previous snapshot stays live.
class RebuildError : public std::runtime_error {
public:
  explicit RebuildError(const std::string &message)
      : std::runtime_error(message) {}
};

} // namespace reqtrace
