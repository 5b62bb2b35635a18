#pragma once

#include <reqtrace/annotation_scanner.h>
#include <reqtrace/logging.h>
#include <reqtrace/models.h>
#include <reqtrace/pattern_resolver.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace reqtrace {

// Everything one rebuild gathered before merging.
struct BuildInputs {
  ResolutionResult resolution;
  // Spec name to rule declarations in document order.
  std::map<std::string, std::vector<Rule>> rules;
  // Relative path to scan output.
  std::map<std::string, ScannedFile> files;
};

// Merges parser and scanner output into the forward and reverse indices.
// Data inconsistencies become unresolved references or annotation
// problems, never exceptions.
class IndexBuilder {
public:
  explicit IndexBuilder(std::shared_ptr<Logger> logger = nullptr);

  IndexSnapshot Build(const TraceConfig &config, BuildInputs inputs) const;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace reqtrace
