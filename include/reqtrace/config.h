#pragma once

#include <reqtrace/logging.h>
#include <reqtrace/models.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace reqtrace {

struct ProjectConfig {
  TraceConfig trace;
  std::optional<LogLevel> log_level;
  std::filesystem::path config_file;
};

// <root>/.config/reqtrace/config.yaml
std::filesystem::path DefaultConfigPath(const std::filesystem::path &root);

const std::vector<std::string> &SupportedConfigKeys();
std::string NormalizeConfigKey(std::string key);

// Both throw ConfigError for malformed documents, unknown keys, missing
// names or prefixes, and unknown comment families.
ProjectConfig ParseConfigFile(const std::filesystem::path &path,
                              const std::filesystem::path &root);
ProjectConfig ParseConfigString(const std::string &document,
                                const std::filesystem::path &root);

} // namespace reqtrace
