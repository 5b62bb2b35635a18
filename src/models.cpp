#include <reqtrace/models.h>

#include <algorithm>
#include <cctype>

namespace reqtrace {
namespace {

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

} // namespace

bool IsValidRuleId(const std::string &id) {
  if (id.empty() || id.front() == '.' || id.back() == '.' ||
      id.find("..") != std::string::npos) {
    return false;
  }
  return std::all_of(id.begin(), id.end(), [](char character) {
    return std::isalnum(static_cast<unsigned char>(character)) != 0 ||
           character == '.' || character == '_' || character == '-' ||
           character == '+';
  });
}

const char *VerbName(Verb verb) {
  switch (verb) {
  case Verb::kImpl:
    return "impl";
  case Verb::kVerify:
    return "verify";
  case Verb::kDepends:
    return "depends";
  case Verb::kRelated:
    return "related";
  }
  return "unknown";
}

std::optional<Verb> ParseVerb(const std::string &text) {
  if (text == "impl") {
    return Verb::kImpl;
  }
  if (text == "verify") {
    return Verb::kVerify;
  }
  if (text == "depends") {
    return Verb::kDepends;
  }
  if (text == "related") {
    return Verb::kRelated;
  }
  return std::nullopt;
}

const char *LevelName(Level level) {
  switch (level) {
  case Level::kMust:
    return "must";
  case Level::kShould:
    return "should";
  case Level::kMay:
    return "may";
  }
  return "unknown";
}

std::optional<Level> ParseLevel(const std::string &text) {
  const auto normalized = ToLower(text);
  if (normalized == "must") {
    return Level::kMust;
  }
  if (normalized == "should") {
    return Level::kShould;
  }
  if (normalized == "may") {
    return Level::kMay;
  }
  return std::nullopt;
}

const char *UnitKindName(UnitKind kind) {
  switch (kind) {
  case UnitKind::kFunction:
    return "function";
  case UnitKind::kType:
    return "type";
  case UnitKind::kBlock:
    return "block";
  case UnitKind::kLine:
    return "line";
  }
  return "unknown";
}

const char *FindingKindName(FindingKind kind) {
  switch (kind) {
  case FindingKind::kConfigError:
    return "ConfigError";
  case FindingKind::kBrokenReference:
    return "BrokenReference";
  case FindingKind::kDuplicateRuleId:
    return "DuplicateRuleId";
  case FindingKind::kPrefixMismatch:
    return "PrefixMismatch";
  case FindingKind::kMalformedAnnotation:
    return "MalformedAnnotation";
  case FindingKind::kStale:
    return "Stale";
  case FindingKind::kImplInTestFile:
    return "ImplInTestFile";
  }
  return "Unknown";
}

} // namespace reqtrace
