#pragma once

#include <reqtrace/models.h>

#include <optional>
#include <string>
#include <vector>

namespace reqtrace {

// RFC-2119 keyword tiers, case-insensitive, whole words; the first tier
// with a hit wins.
std::optional<Level> InferLevel(const std::string &text);

class SpecParser {
public:
  explicit SpecParser(std::string prefix);

  // Every rule declaration in document order, duplicates included.
  std::vector<Rule> Parse(const std::string &source_file,
                          const std::string &content) const;

private:
  std::string prefix_;
};

} // namespace reqtrace
