#include <reqtrace/glob.h>

#include <reqtrace/errors.h>

#include <algorithm>
#include <cstring>
#include <utility>

namespace reqtrace {
namespace {

bool IsRegexSpecial(char character) {
  return std::strchr("\\^$.|+()[]{}*?", character) != nullptr;
}

std::size_t TranslateClass(const std::string &pattern, std::size_t index,
                           std::string &out) {
  const auto close = pattern.find(']', index + 1);
  if (close == std::string::npos) {
    throw ConfigError("Unterminated '[' in glob pattern: " + pattern);
  }
  out.push_back('[');
  std::size_t cursor = index + 1;
  if (cursor < close && (pattern[cursor] == '!' || pattern[cursor] == '^')) {
    out.push_back('^');
    ++cursor;
  }
  for (; cursor < close; ++cursor) {
    if (pattern[cursor] == '\\' || pattern[cursor] == '[') {
      out.push_back('\\');
    }
    out.push_back(pattern[cursor]);
  }
  out.push_back(']');
  return close;
}

} // namespace

std::string GlobToRegex(const std::string &pattern) {
  std::string out;
  int brace_depth = 0;
  for (std::size_t i = 0; i < pattern.size(); ++i) {
    const auto character = pattern[i];
    if (character == '*') {
      const bool double_star = i + 1 < pattern.size() && pattern[i + 1] == '*';
      if (!double_star) {
        out.append("[^/]*");
        continue;
      }
      const bool at_segment_start = i == 0 || pattern[i - 1] == '/';
      const bool followed_by_slash =
          i + 2 < pattern.size() && pattern[i + 2] == '/';
      if (at_segment_start && followed_by_slash) {
        // "**/" matches zero or more whole directories.
        out.append("(?:[^/]+/)*");
        i += 2;
      } else {
        out.append(".*");
        ++i;
      }
      continue;
    }
    if (character == '?') {
      out.append("[^/]");
      continue;
    }
    if (character == '[') {
      i = TranslateClass(pattern, i, out);
      continue;
    }
    if (character == '{') {
      ++brace_depth;
      out.append("(?:");
      continue;
    }
    if (character == '}' && brace_depth > 0) {
      --brace_depth;
      out.push_back(')');
      continue;
    }
    if (character == ',' && brace_depth > 0) {
      out.push_back('|');
      continue;
    }
    if (IsRegexSpecial(character)) {
      out.push_back('\\');
    }
    out.push_back(character);
  }
  if (brace_depth != 0) {
    throw ConfigError("Unterminated '{' in glob pattern: " + pattern);
  }
  return out;
}

GlobPattern::GlobPattern(std::string pattern) : pattern_(std::move(pattern)) {
  if (pattern_.empty()) {
    throw ConfigError("Glob pattern cannot be empty");
  }
  try {
    regex_ = std::regex(GlobToRegex(pattern_), std::regex::ECMAScript);
  } catch (const std::regex_error &error) {
    throw ConfigError("Invalid glob pattern '" + pattern_ +
                      "': " + error.what());
  }
}

bool GlobPattern::Matches(const std::string &relative_path) const {
  return std::regex_match(relative_path, regex_);
}

bool MatchesAny(const std::vector<GlobPattern> &patterns,
                const std::string &relative_path) {
  return std::any_of(patterns.begin(), patterns.end(),
                     [&](const GlobPattern &pattern) {
                       return pattern.Matches(relative_path);
                     });
}

} // namespace reqtrace
