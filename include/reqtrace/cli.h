#pragma once

#include <reqtrace/logging.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace reqtrace {

struct QueryOptions {
  std::string command;
  std::vector<std::string> positionals;
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::string> spec_impl;
  std::optional<std::string> prefix;
  std::optional<std::string> path;
  std::optional<std::size_t> limit;
  std::optional<LogLevel> log_level;
  std::string format = "markdown";
  bool show_help = false;
};

const std::vector<std::string> &SupportedCommands();

// arguments exclude the program name; the first non-option is the command.
QueryOptions ParseQueryArguments(const std::vector<std::string> &arguments);

// Builds the index once, runs the command and writes the rendered result to
// out. Returns the process exit code; NotFoundError and configuration
// errors propagate to the caller.
int RunCommand(const QueryOptions &options, std::ostream &out);

// Builds the index, prints the status report, then watches the project and
// prints it again after every reload until keep_watching returns false.
int RunWatch(const QueryOptions &options, std::ostream &out,
             const std::function<bool()> &keep_watching,
             std::chrono::milliseconds poll_interval =
                 std::chrono::milliseconds(500));

void PrintUsage(std::ostream &out);

} // namespace reqtrace
