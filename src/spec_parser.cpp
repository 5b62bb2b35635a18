#include <reqtrace/spec_parser.h>

#include <reqtrace/staleness.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <utility>

namespace reqtrace {
namespace {

struct Marker {
  std::string id;
  std::optional<Level> level;
  std::optional<std::string> status;
  std::string trailing_text;
};

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::vector<std::string> SplitLines(const std::string &content) {
  std::vector<std::string> lines;
  std::string current;
  for (const auto character : content) {
    if (character == '\n') {
      if (!current.empty() && current.back() == '\r') {
        current.pop_back();
      }
      lines.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(character);
  }
  if (!current.empty()) {
    lines.push_back(std::move(current));
  }
  return lines;
}

std::vector<std::string> SplitWhitespace(const std::string &text) {
  std::istringstream stream(text);
  std::vector<std::string> tokens;
  std::string token;
  while (stream >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

bool IsBlank(const std::string &line) { return Trim(line).empty(); }

bool IsHeading(const std::string &trimmed) {
  std::size_t hashes = 0;
  while (hashes < trimmed.size() && trimmed[hashes] == '#') {
    ++hashes;
  }
  if (hashes == 0 || hashes > 6) {
    return false;
  }
  return hashes == trimmed.size() || trimmed[hashes] == ' ' ||
         trimmed[hashes] == '\t';
}

// Returns the fence token ("```" or "~~~") opening or closing a code block.
std::string FenceToken(const std::string &trimmed) {
  for (const auto *fence : {"```", "~~~"}) {
    if (trimmed.rfind(fence, 0) == 0) {
      return fence;
    }
  }
  return {};
}

std::optional<Marker> ParseMarker(const std::string &trimmed,
                                  const std::string &prefix) {
  const auto opener = prefix + "[";
  if (trimmed.rfind(opener, 0) != 0) {
    return std::nullopt;
  }
  const auto close = trimmed.find(']', opener.size());
  if (close == std::string::npos) {
    return std::nullopt;
  }
  const auto tokens =
      SplitWhitespace(trimmed.substr(opener.size(), close - opener.size()));
  if (tokens.empty() || !IsValidRuleId(tokens.front())) {
    return std::nullopt;
  }

  Marker marker;
  marker.id = tokens.front();
  for (std::size_t i = 1; i < tokens.size(); ++i) {
    const auto equals = tokens[i].find('=');
    if (equals == std::string::npos) {
      continue;
    }
    const auto key = tokens[i].substr(0, equals);
    const auto value = tokens[i].substr(equals + 1);
    if (key == "level") {
      marker.level = ParseLevel(value);
    } else if (key == "status") {
      marker.status = value;
    }
  }
  marker.trailing_text = trimmed.substr(close + 1);
  return marker;
}

std::set<std::string> UpperWords(const std::string &text) {
  std::set<std::string> words;
  std::string current;
  for (const auto character : text) {
    if (std::isalpha(static_cast<unsigned char>(character)) != 0) {
      current.push_back(static_cast<char>(
          std::toupper(static_cast<unsigned char>(character))));
      continue;
    }
    if (!current.empty()) {
      words.insert(current);
      current.clear();
    }
  }
  if (!current.empty()) {
    words.insert(current);
  }
  return words;
}

} // namespace

std::optional<Level> InferLevel(const std::string &text) {
  struct LevelTier {
    Level level;
    std::vector<std::string> keywords;
  };
  // "MUST NOT", "SHALL NOT" and "NOT RECOMMENDED" fall into the tier of
  // their keyword; NOT alone decides nothing.
  static const std::vector<LevelTier> kTiers = {
      {Level::kMust, {"MUST", "SHALL", "REQUIRED"}},
      {Level::kShould, {"SHOULD", "RECOMMENDED"}},
      {Level::kMay, {"MAY", "OPTIONAL"}}};

  const auto words = UpperWords(text);
  for (const auto &tier : kTiers) {
    for (const auto &keyword : tier.keywords) {
      if (words.count(keyword) != 0) {
        return tier.level;
      }
    }
  }
  return std::nullopt;
}

SpecParser::SpecParser(std::string prefix) : prefix_(std::move(prefix)) {}

std::vector<Rule> SpecParser::Parse(const std::string &source_file,
                                    const std::string &content) const {
  // A UTF-8 byte order mark would hide a marker on the first line.
  static const std::string kByteOrderMark = "\xEF\xBB\xBF";
  const auto lines = SplitLines(content.rfind(kByteOrderMark, 0) == 0
                                    ? content.substr(kByteOrderMark.size())
                                    : content);
  std::vector<Rule> rules;
  std::optional<Rule> open;
  std::vector<std::string> body;
  std::string fence;

  const auto close_open_rule = [&]() {
    if (!open) {
      return;
    }
    std::string text;
    for (std::size_t i = 0; i < body.size(); ++i) {
      if (i > 0) {
        text.push_back('\n');
      }
      text.append(body[i]);
    }
    open->text = Trim(text);
    if (!open->level_explicit) {
      open->level = InferLevel(open->text);
    }
    open->fingerprint = Fingerprint(open->text);
    rules.push_back(std::move(*open));
    open.reset();
    body.clear();
  };

  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto trimmed = Trim(lines[i]);

    if (!fence.empty()) {
      if (trimmed.rfind(fence, 0) == 0) {
        fence.clear();
      }
      if (open) {
        body.push_back(lines[i]);
      }
      continue;
    }
    if (const auto opening = FenceToken(trimmed); !opening.empty()) {
      fence = opening;
      if (open) {
        body.push_back(lines[i]);
      }
      continue;
    }

    if (IsHeading(trimmed)) {
      close_open_rule();
      continue;
    }

    const bool after_blank = i == 0 || IsBlank(lines[i - 1]);
    if (after_blank) {
      if (auto marker = ParseMarker(trimmed, prefix_)) {
        close_open_rule();
        Rule rule;
        rule.id = marker->id;
        rule.level = marker->level;
        rule.level_explicit = marker->level.has_value();
        rule.status = marker->status;
        rule.source_file = source_file;
        rule.source_line = i + 1;
        open = std::move(rule);
        body.push_back(marker->trailing_text);
        continue;
      }
    }

    if (open) {
      body.push_back(lines[i]);
    }
  }
  close_open_rule();
  return rules;
}

} // namespace reqtrace
