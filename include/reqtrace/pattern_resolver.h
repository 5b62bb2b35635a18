#pragma once

#include <reqtrace/interfaces.h>
#include <reqtrace/logging.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace reqtrace {

struct ResolvedSpec {
  std::string name;
  std::string prefix;
  std::vector<std::string> documents;
};

struct ResolutionResult {
  std::vector<ResolvedSpec> specs;
  std::vector<Pairing> pairings;
  std::vector<Finding> findings;
};

class DiskFileLister : public FileLister {
public:
  std::vector<std::string> ListFiles(const std::filesystem::path &root) override;
};

class DiskSourceReader : public SourceReader {
public:
  std::string Read(const std::filesystem::path &path) override;
};

class PatternResolver {
public:
  explicit PatternResolver(std::shared_ptr<FileLister> lister = nullptr,
                           std::shared_ptr<Logger> logger = nullptr);

  ResolutionResult Resolve(const TraceConfig &config);

private:
  std::shared_ptr<FileLister> lister_;
  std::shared_ptr<Logger> logger_;
};

} // namespace reqtrace
