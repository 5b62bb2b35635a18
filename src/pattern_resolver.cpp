#include <reqtrace/pattern_resolver.h>

#include <reqtrace/errors.h>
#include <reqtrace/glob.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>
#include <system_error>
#include <utility>

namespace reqtrace {
namespace {

std::filesystem::path ResolveRootPath(const TraceConfig &config) {
  if (config.root_path.empty()) {
    throw RebuildError("TraceConfig.root_path must not be empty.");
  }

  const auto normalized_root =
      std::filesystem::weakly_canonical(config.root_path);

  if (!std::filesystem::exists(normalized_root) ||
      !std::filesystem::is_directory(normalized_root)) {
    throw RebuildError("Project root is not a directory: " +
                       normalized_root.string());
  }
  return normalized_root;
}

std::vector<GlobPattern> CompilePatterns(const std::vector<std::string> &raw) {
  std::vector<GlobPattern> patterns;
  patterns.reserve(raw.size());
  for (const auto &pattern : raw) {
    patterns.emplace_back(pattern);
  }
  return patterns;
}

std::vector<std::string> Select(const std::vector<std::string> &files,
                                const std::vector<GlobPattern> &include,
                                const std::vector<GlobPattern> &exclude) {
  std::vector<std::string> selected;
  for (const auto &file : files) {
    if (MatchesAny(include, file) && !MatchesAny(exclude, file)) {
      selected.push_back(file);
    }
  }
  return selected;
}

Finding ConfigFinding(std::string message, const std::string &spec,
                      const std::string &impl) {
  Finding finding;
  finding.kind = FindingKind::kConfigError;
  finding.message = std::move(message);
  finding.spec = spec;
  finding.impl = impl;
  return finding;
}

} // namespace

std::vector<std::string>
DiskFileLister::ListFiles(const std::filesystem::path &root) {
  std::vector<std::string> files;
  std::error_code error;
  std::filesystem::recursive_directory_iterator iterator(
      root, std::filesystem::directory_options::skip_permission_denied, error);
  if (error) {
    throw RebuildError("Failed to walk " + root.string() + ": " +
                       error.message());
  }

  for (const auto end = std::filesystem::recursive_directory_iterator();
       iterator != end; iterator.increment(error)) {
    if (error) {
      throw RebuildError("Failed to walk " + root.string() + ": " +
                         error.message());
    }
    const auto &entry = *iterator;
    std::error_code status_error;
    if (entry.is_directory(status_error) &&
        entry.path().filename() == ".git") {
      iterator.disable_recursion_pending();
      continue;
    }
    if (!entry.is_regular_file(status_error)) {
      continue;
    }
    files.push_back(entry.path().lexically_relative(root).generic_string());
  }

  std::sort(files.begin(), files.end());
  return files;
}

std::string DiskSourceReader::Read(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw RebuildError("Failed to open " + path.string());
  }
  std::string content((std::istreambuf_iterator<char>(stream)),
                      std::istreambuf_iterator<char>());
  if (stream.bad()) {
    throw RebuildError("Failed to read " + path.string());
  }
  return content;
}

PatternResolver::PatternResolver(std::shared_ptr<FileLister> lister,
                                 std::shared_ptr<Logger> logger)
    : lister_(lister ? std::move(lister)
                     : std::make_shared<DiskFileLister>()),
      logger_(EnsureLogger(std::move(logger))) {}

ResolutionResult PatternResolver::Resolve(const TraceConfig &config) {
  const auto root = ResolveRootPath(config);
  const auto files = lister_->ListFiles(root);
  logger_->Log(LogLevel::kDebug, "resolver.walk",
               {{"root", root.string()},
                {"file_count", std::to_string(files.size())}});

  ResolutionResult result;
  for (const auto &spec : config.specs) {
    ResolvedSpec resolved{spec.name, spec.prefix, {}};
    try {
      if (spec.include.empty()) {
        throw ConfigError("Spec '" + spec.name +
                          "' declares no document include patterns");
      }
      resolved.documents = Select(files, CompilePatterns(spec.include), {});
      if (resolved.documents.empty()) {
        throw ConfigError("Spec '" + spec.name +
                          "' document patterns matched no files");
      }
    } catch (const ConfigError &error) {
      logger_->Log(LogLevel::kWarn, "config.spec.excluded",
                   {{"spec", spec.name}, {"reason", error.what()}});
      result.findings.push_back(ConfigFinding(error.what(), spec.name, ""));
      continue;
    }

    for (const auto &impl : spec.impls) {
      Pairing pairing{spec.name, impl.name, {}, {}};
      try {
        if (impl.include.empty()) {
          throw ConfigError("Implementation '" + pairing.Key() +
                            "' declares no include patterns");
        }
        const auto exclude = CompilePatterns(impl.exclude);
        const auto sources =
            Select(files, CompilePatterns(impl.include), exclude);
        const auto tests =
            Select(files, CompilePatterns(impl.test_include), exclude);

        std::set<std::string> merged(sources.begin(), sources.end());
        merged.insert(tests.begin(), tests.end());
        if (merged.empty()) {
          throw ConfigError("Implementation '" + pairing.Key() +
                            "' include patterns matched no files");
        }
        pairing.files.assign(merged.begin(), merged.end());
        pairing.test_files.insert(tests.begin(), tests.end());
      } catch (const ConfigError &error) {
        logger_->Log(LogLevel::kWarn, "config.pairing.excluded",
                     {{"pairing", pairing.Key()}, {"reason", error.what()}});
        result.findings.push_back(
            ConfigFinding(error.what(), spec.name, impl.name));
        continue;
      }

      logger_->Log(LogLevel::kDebug, "resolver.pairing",
                   {{"pairing", pairing.Key()},
                    {"files", std::to_string(pairing.files.size())},
                    {"test_files", std::to_string(pairing.test_files.size())}});
      result.pairings.push_back(std::move(pairing));
    }
    result.specs.push_back(std::move(resolved));
  }
  return result;
}

} // namespace reqtrace
