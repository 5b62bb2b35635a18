#pragma once

#include <reqtrace/models.h>

#include <filesystem>
#include <string>
#include <vector>

namespace reqtrace {

class FileLister {
public:
  virtual ~FileLister() = default;
  // Regular files under root as sorted, '/'-separated relative paths.
  virtual std::vector<std::string>
  ListFiles(const std::filesystem::path &root) = 0;
};

class SourceReader {
public:
  virtual ~SourceReader() = default;
  // Throws RebuildError when the file cannot be read.
  virtual std::string Read(const std::filesystem::path &path) = 0;
};

class IndexPipeline {
public:
  virtual ~IndexPipeline() = default;
  virtual IndexSnapshot Build(const TraceConfig &config) = 0;
};

} // namespace reqtrace
