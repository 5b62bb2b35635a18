#pragma once

#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace reqtrace {

enum class LogLevel { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

using LogFields = std::vector<std::pair<std::string, std::string>>;

struct LoggingConfig {
  LogLevel level = LogLevel::kWarn;
};

class Logger {
public:
  virtual ~Logger() = default;
  virtual void Log(LogLevel level, std::string_view message,
                   LogFields fields = {}) = 0;
  virtual LogLevel Level() const = 0;
  bool IsEnabled(LogLevel level) const {
    return static_cast<int>(level) <= static_cast<int>(Level());
  }
};

class NullLogger : public Logger {
public:
  void Log(LogLevel, std::string_view, LogFields) override {}
  LogLevel Level() const override { return LogLevel::kError; }
};

// Safe to share between scanner workers; each record is written whole.
class StructuredLogger : public Logger {
public:
  StructuredLogger(std::ostream &stream, LoggingConfig config);
  void Log(LogLevel level, std::string_view message,
           LogFields fields) override;
  LogLevel Level() const override { return config_.level; }

private:
  std::ostream *stream_;
  LoggingConfig config_;
  std::mutex mutex_;
};

const char *LogLevelName(LogLevel level);
LogLevel ParseLogLevel(const std::string &value);

std::shared_ptr<Logger> EnsureLogger(std::shared_ptr<Logger> logger);
std::shared_ptr<Logger> MakeLogger(const LoggingConfig &config,
                                   std::ostream &stream);

} // namespace reqtrace
