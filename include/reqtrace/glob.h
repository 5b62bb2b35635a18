#pragma once

#include <regex>
#include <string>
#include <vector>

namespace reqtrace {

// Translates a path glob into an ECMAScript regex matching the whole
// '/'-separated relative path. Supports *, **, ?, [...], [!...], {a,b}.
std::string GlobToRegex(const std::string &pattern);

class GlobPattern {
public:
  explicit GlobPattern(std::string pattern);

  bool Matches(const std::string &relative_path) const;
  const std::string &Pattern() const { return pattern_; }

private:
  std::string pattern_;
  std::regex regex_;
};

bool MatchesAny(const std::vector<GlobPattern> &patterns,
                const std::string &relative_path);

} // namespace reqtrace
