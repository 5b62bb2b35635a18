#include <reqtrace/cli.h>

#include <reqtrace/cli_exit_codes.h>
#include <reqtrace/component_registry.h>
#include <reqtrace/config.h>
#include <reqtrace/file_watcher.h>
#include <reqtrace/index_pipeline.h>
#include <reqtrace/query_service.h>
#include <reqtrace/reload_controller.h>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

namespace reqtrace {
namespace {

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

std::size_t ParseLimit(const std::string &value) {
  std::size_t consumed = 0;
  unsigned long parsed = 0;
  try {
    parsed = std::stoul(value, &consumed);
  } catch (const std::logic_error &) {
    throw std::invalid_argument("--limit expects a positive number, got " +
                                value);
  }
  if (consumed != value.size() || parsed == 0) {
    throw std::invalid_argument("--limit expects a positive number, got " +
                                value);
  }
  return static_cast<std::size_t>(parsed);
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, QueryOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level = ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleFilterOption(const std::vector<std::string> &arguments,
                        std::size_t &index, QueryOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--spec-impl" || argument == "--impl") {
    options.spec_impl = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--prefix") {
    options.prefix = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--path") {
    options.path = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--limit") {
    options.limit = ParseLimit(RequireValue(arguments, index, argument));
    return true;
  }
  return false;
}

bool DispatchOption(const std::vector<std::string> &arguments,
                    std::size_t &index, QueryOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--root") {
    options.root = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--json") {
    options.format = "json";
    return true;
  }
  if (argument == "--format") {
    options.format = RequireValue(arguments, index, argument);
    return true;
  }
  return HandleLoggingOption(arguments, index, options) ||
         HandleFilterOption(arguments, index, options);
}

void ValidateOptions(const QueryOptions &options) {
  const auto &commands = SupportedCommands();
  if (std::find(commands.begin(), commands.end(), options.command) ==
      commands.end()) {
    throw std::invalid_argument("Unknown command: " + options.command);
  }
  if (options.command == "rule" && options.positionals.empty()) {
    throw std::invalid_argument("rule requires at least one rule id");
  }
  if (options.command == "search" && options.positionals.empty()) {
    throw std::invalid_argument("search requires a query");
  }
  const bool takes_positionals = options.command == "rule" ||
                                 options.command == "search" ||
                                 options.command == "unmapped";
  if (!takes_positionals && !options.positionals.empty()) {
    throw std::invalid_argument("Unexpected argument: " +
                                options.positionals.front());
  }
  if (options.command == "unmapped" && options.positionals.size() > 1) {
    throw std::invalid_argument("unmapped accepts a single path");
  }
}

std::string JoinWords(const std::vector<std::string> &words) {
  std::string joined;
  for (const auto &word : words) {
    joined += joined.empty() ? word : " " + word;
  }
  return joined;
}

LoggingConfig BuildLoggingConfig(const QueryOptions &options,
                                 const ProjectConfig &project) {
  LoggingConfig logging;
  logging.level = options.log_level.value_or(
      project.log_level.value_or(LogLevel::kWarn));
  return logging;
}

// Everything one invocation needs: the resolved paths, the logger, the
// renderer and a controller whose first build has already run.
struct Session {
  std::filesystem::path root;
  std::filesystem::path config_path;
  std::shared_ptr<Logger> logger;
  std::unique_ptr<ReportRenderer> renderer;
  std::unique_ptr<ReloadController> controller;
};

Session OpenSession(const QueryOptions &options) {
  Session session;
  session.root = std::filesystem::weakly_canonical(
      options.root.value_or(std::filesystem::current_path()));
  session.config_path =
      options.config_file.value_or(DefaultConfigPath(session.root));
  const auto project = ParseConfigFile(session.config_path, session.root);
  session.logger =
      MakeLogger(BuildLoggingConfig(options, project), std::clog);

  const auto &registry = GlobalComponentRegistry();
  session.renderer = registry.CreateRenderer(options.format);

  const auto config_path = session.config_path;
  const auto root = session.root;
  session.controller = std::make_unique<ReloadController>(
      [config_path, root]() { return ParseConfigFile(config_path, root).trace; },
      IndexPipelineBuilder(registry).WithLogger(session.logger).Build(),
      session.logger);
  session.controller->Reload();
  return session;
}

void WriteStatus(const Session &session, const QueryOptions &options,
                 std::ostream &out) {
  const QueryService queries(*session.controller);
  out << session.renderer->RenderStatus(queries.Status());
  if (options.format == "json") {
    out << "\n";
  }
  out.flush();
}

} // namespace

const std::vector<std::string> &SupportedCommands() {
  static const std::vector<std::string> commands = {
      "status", "uncovered", "untested", "stale",  "unmapped",
      "rule",   "validate",  "search",   "config", "watch"};
  return commands;
}

void PrintUsage(std::ostream &out) {
  out << "Usage: reqtrace <command> [arguments] [options]\n\n"
      << "Commands:\n"
      << "  status              Coverage totals per spec/impl\n"
      << "  uncovered           Rules without impl references\n"
      << "  untested            Rules without verify references\n"
      << "  stale               References to changed rule text\n"
      << "  unmapped [path]     Coverage tree and units without references\n"
      << "  rule <id>...        Rule text, declarations and references\n"
      << "  validate            Broken, duplicate, malformed references\n"
      << "  search <query>      Search rules and code units\n"
      << "  config              Show the active configuration\n"
      << "  watch               Reprint status whenever watched files change\n\n"
      << "Options:\n"
      << "  --root <path>       Project root (default: current directory)\n"
      << "  --config <file>     Config file (default: "
         ".config/reqtrace/config.yaml)\n"
      << "  --spec-impl <s/i>   Restrict to one spec/impl pairing\n"
      << "  --prefix <id>       Restrict to rule ids starting with <id>\n"
      << "  --path <path>       Subtree for unmapped\n"
      << "  --limit <n>         Maximum search results (default: 50)\n"
      << "  --json              Shortcut for --format json\n"
      << "  --format <name>     Renderer (markdown, json)\n"
      << "  --log-level <level> Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose           Shortcut for --log-level info\n"
      << "  --debug             Shortcut for --log-level debug\n"
      << "  --help              Show this message\n";
}

QueryOptions ParseQueryArguments(const std::vector<std::string> &arguments) {
  QueryOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (argument.rfind('-', 0) == 0 && argument.size() > 1) {
      if (!DispatchOption(arguments, i, options)) {
        throw std::invalid_argument("Unknown argument: " + argument);
      }
      if (options.show_help) {
        return options;
      }
      continue;
    }
    if (options.command.empty()) {
      options.command = argument;
    } else {
      options.positionals.push_back(argument);
    }
  }
  if (options.command.empty()) {
    options.show_help = true;
    return options;
  }
  ValidateOptions(options);
  return options;
}

int RunCommand(const QueryOptions &options, std::ostream &out) {
  if (options.show_help) {
    PrintUsage(out);
    return kExitSuccess;
  }
  if (options.command == "watch") {
    // Runs until the process is interrupted.
    return RunWatch(options, out, []() { return true; });
  }

  const auto session = OpenSession(options);
  const auto &renderer = session.renderer;
  const QueryService queries(*session.controller);

  const auto &command = options.command;
  if (command == "status") {
    out << renderer->RenderStatus(queries.Status());
  } else if (command == "uncovered") {
    out << renderer->RenderRules(
        "Uncovered Rules", queries.Uncovered(options.spec_impl, options.prefix));
  } else if (command == "untested") {
    out << renderer->RenderRules(
        "Untested Rules", queries.Untested(options.spec_impl, options.prefix));
  } else if (command == "stale") {
    out << renderer->RenderStale(
        queries.Stale(options.spec_impl, options.prefix));
  } else if (command == "unmapped") {
    auto path = options.path;
    if (!options.positionals.empty()) {
      path = options.positionals.front();
    }
    out << renderer->RenderUnmapped(queries.Unmapped(path, options.spec_impl));
  } else if (command == "rule") {
    std::vector<RuleReport> rules;
    for (const auto &id : options.positionals) {
      rules.push_back(queries.RuleDetail(id));
    }
    out << renderer->RenderRuleDetails(rules);
  } else if (command == "validate") {
    const auto findings = queries.Validate();
    out << renderer->RenderFindings(findings);
    return FindingsExitCode(findings);
  } else if (command == "search") {
    out << renderer->RenderSearch(
        queries.Search(JoinWords(options.positionals),
                       options.limit.value_or(kDefaultSearchLimit)));
  } else if (command == "config") {
    out << renderer->RenderConfig(queries.Config());
  }
  if (options.format == "json") {
    out << "\n";
  }
  return kExitSuccess;
}

int RunWatch(const QueryOptions &options, std::ostream &out,
             const std::function<bool()> &keep_watching,
             std::chrono::milliseconds poll_interval) {
  const auto session = OpenSession(options);
  FileWatcher::Options watch_options;
  watch_options.poll_interval = poll_interval;
  watch_options.config_file = session.config_path;
  FileWatcher watcher(*session.controller, session.root, watch_options,
                      session.logger);

  auto printed = session.controller->Version();
  WriteStatus(session, options, out);
  watcher.Start();
  while (keep_watching()) {
    std::this_thread::sleep_for(poll_interval);
    const auto version = session.controller->Version();
    if (version != printed) {
      printed = version;
      WriteStatus(session, options, out);
    }
  }
  watcher.Stop();
  return kExitSuccess;
}

} // namespace reqtrace
