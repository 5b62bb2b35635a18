#include <reqtrace/annotation_scanner.h>

#include <reqtrace/staleness.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace reqtrace {
namespace {

bool IsPrefixChar(char character) {
  return std::isalnum(static_cast<unsigned char>(character)) != 0 ||
         character == '_' || character == '-';
}

bool IsDecoration(char character) {
  return std::isspace(static_cast<unsigned char>(character)) != 0 ||
         character == '/' || character == '!' || character == '*' ||
         character == '#' || character == '-' || character == ';';
}

std::vector<std::string> SplitContent(const std::string &content) {
  std::istringstream stream(content);
  std::vector<std::string> tokens;
  std::string token;
  while (stream >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

void ParseRuleToken(const std::string &token, RawAnnotation &annotation) {
  const auto at = token.rfind('@');
  annotation.rule_id = token.substr(0, at);
  if (at != std::string::npos) {
    const auto captured = token.substr(at + 1);
    if (!IsValidCapturedFingerprint(captured)) {
      annotation.problem = "invalid fingerprint '" + captured +
                           "' (expected 8-16 hex digits)";
      return;
    }
    annotation.fingerprint = captured;
  }
  if (!IsValidRuleId(annotation.rule_id)) {
    annotation.problem = annotation.rule_id.empty()
                             ? "empty rule id"
                             : "invalid rule id '" + annotation.rule_id + "'";
  }
}

RawAnnotation ParseContent(std::string prefix, const std::string &content,
                           std::size_t line) {
  RawAnnotation annotation;
  annotation.prefix = std::move(prefix);
  annotation.line = line;

  const auto tokens = SplitContent(content);
  if (tokens.empty()) {
    annotation.problem = "empty annotation";
    return annotation;
  }
  if (tokens.size() > 2) {
    annotation.problem = "unexpected tokens in '" + content + "'";
    return annotation;
  }

  if (tokens.size() == 1) {
    if (ParseVerb(tokens.front())) {
      annotation.explicit_verb = true;
      annotation.problem = "missing rule id after verb '" + tokens.front() + "'";
      return annotation;
    }
    annotation.verb = Verb::kImpl;
    ParseRuleToken(tokens.front(), annotation);
    if (annotation.IsMalformed()) {
      annotation.verb.reset();
    }
    return annotation;
  }

  annotation.explicit_verb = true;
  const auto verb = ParseVerb(tokens.front());
  if (!verb) {
    annotation.rule_id = tokens.back();
    annotation.problem = "unknown verb '" + tokens.front() + "'";
    return annotation;
  }
  annotation.verb = verb;
  ParseRuleToken(tokens.back(), annotation);
  if (annotation.IsMalformed()) {
    annotation.verb.reset();
  }
  return annotation;
}

// First and last line (1-based) of the comment-only run around line.
std::pair<std::size_t, std::size_t>
CommentBlockAround(const LexedSource &source, std::size_t line,
                   const std::vector<CodeUnit> &units) {
  auto first = line;
  auto last = line;
  if (source.lines[line - 1].HasCode()) {
    return {first, last};
  }
  while (first > 1 && source.lines[first - 2].IsCommentOnly() &&
         !InnermostUnit(units, first - 1)) {
    --first;
  }
  while (last < source.lines.size() && source.lines[last].IsCommentOnly() &&
         !InnermostUnit(units, last + 1)) {
    ++last;
  }
  return {first, last};
}

void SynthesizeLineUnits(const LexedSource &source,
                         const std::vector<RawAnnotation> &annotations,
                         std::vector<CodeUnit> &units) {
  for (const auto &annotation : annotations) {
    if (InnermostUnit(units, annotation.line)) {
      continue;
    }
    auto [first, last] = CommentBlockAround(source, annotation.line, units);
    const bool trailing = source.lines[annotation.line - 1].HasCode();
    const auto next = last + 1;
    if (!trailing && next <= source.lines.size() &&
        source.lines[next - 1].HasCode() && !InnermostUnit(units, next)) {
      last = next;
    }
    units.push_back(
        {source.path, first, last, UnitKind::kLine, std::nullopt, {}});
  }
}

} // namespace

std::vector<RawAnnotation> ParseAnnotations(const std::string &comment,
                                            std::size_t line) {
  std::vector<RawAnnotation> annotations;
  std::size_t position = 0;
  while (position < comment.size() && IsDecoration(comment[position])) {
    ++position;
  }

  while (position < comment.size()) {
    const auto prefix_start = position;
    while (position < comment.size() && IsPrefixChar(comment[position])) {
      ++position;
    }
    if (position == prefix_start || position >= comment.size() ||
        comment[position] != '[') {
      break;
    }
    const auto close = comment.find(']', position);
    const auto nested = comment.find('[', position + 1);
    if (close == std::string::npos ||
        (nested != std::string::npos && nested < close)) {
      break;
    }
    annotations.push_back(ParseContent(
        comment.substr(prefix_start, position - prefix_start),
        comment.substr(position + 1, close - position - 1), line));
    position = close + 1;
    while (position < comment.size() &&
           (comment[position] == ',' ||
            std::isspace(static_cast<unsigned char>(comment[position])) != 0)) {
      ++position;
    }
  }
  return annotations;
}

AnnotationScanner::AnnotationScanner(CommentStyleTable styles,
                                     const ComponentRegistry &registry)
    : styles_(std::move(styles)),
      default_locator_(registry.DefaultLocatorName()) {
  for (const auto &name : registry.LocatorNames()) {
    locators_.emplace(name, registry.CreateLocator(name));
  }
}

const UnitLocator &
AnnotationScanner::LocatorFor(const CommentStyle &style) const {
  auto found = locators_.find(style.locator);
  if (found == locators_.end()) {
    found = locators_.find(default_locator_);
  }
  if (found == locators_.end()) {
    throw std::invalid_argument("No unit locator registered for '" +
                                style.locator + "'");
  }
  return *found->second;
}

ScannedFile AnnotationScanner::Scan(const std::string &path,
                                    const std::string &content) const {
  const auto &style = styles_.ForPath(path);
  const auto source = LexSource(path, content, style);

  ScannedFile scanned;
  scanned.path = path;
  scanned.lines.reserve(source.lines.size());
  for (const auto &line : source.lines) {
    scanned.lines.push_back(line.raw);
  }

  for (std::size_t index = 0; index < source.lines.size(); ++index) {
    for (const auto &comment : source.lines[index].comments) {
      auto found = ParseAnnotations(comment, index + 1);
      std::move(found.begin(), found.end(),
                std::back_inserter(scanned.annotations));
    }
  }

  scanned.units = LocatorFor(style).Locate(source);
  SynthesizeLineUnits(source, scanned.annotations, scanned.units);
  std::sort(scanned.units.begin(), scanned.units.end(),
            [](const CodeUnit &left, const CodeUnit &right) {
              return left.start_line != right.start_line
                         ? left.start_line < right.start_line
                         : left.end_line > right.end_line;
            });
  for (auto &annotation : scanned.annotations) {
    // Every annotation line is covered once line units are synthesized.
    annotation.unit_index = *InnermostUnit(scanned.units, annotation.line);
  }
  return scanned;
}

} // namespace reqtrace
