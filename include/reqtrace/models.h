#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace reqtrace {

enum class Verb { kImpl, kVerify, kDepends, kRelated };

enum class Level { kMust, kShould, kMay };

enum class UnitKind { kFunction, kType, kBlock, kLine };

enum class FindingKind {
  kConfigError,
  kBrokenReference,
  kDuplicateRuleId,
  kPrefixMismatch,
  kMalformedAnnotation,
  kStale,
  kImplInTestFile
};

enum class AnnotationIssue {
  kMalformed,
  kUnknownPrefix,
  kAmbiguousPrefix,
  kImplInTestFile
};

const char *VerbName(Verb verb);
std::optional<Verb> ParseVerb(const std::string &text);
const char *LevelName(Level level);
std::optional<Level> ParseLevel(const std::string &text);
const char *UnitKindName(UnitKind kind);
const char *FindingKindName(FindingKind kind);

// Dot-segmented token without brackets, whitespace or empty segments.
bool IsValidRuleId(const std::string &id);

struct ImplConfig {
  std::string name;
  std::vector<std::string> include;
  std::vector<std::string> exclude;
  std::vector<std::string> test_include;
};

struct SpecConfig {
  std::string name;
  std::string prefix;
  std::vector<std::string> include;
  std::vector<ImplConfig> impls;
};

struct TraceConfig {
  std::string root_path;
  std::vector<SpecConfig> specs;
  // Extension (".src") to comment family name ("c").
  std::map<std::string, std::string> languages;
};

struct SourceSite {
  std::string file;
  std::size_t line = 0;

  bool operator<(const SourceSite &other) const {
    return file != other.file ? file < other.file : line < other.line;
  }
  bool operator==(const SourceSite &other) const {
    return file == other.file && line == other.line;
  }
};

struct Rule {
  std::string id;
  std::string text;
  std::optional<Level> level;
  bool level_explicit = false;
  std::optional<std::string> status;
  std::string fingerprint;
  std::string source_file;
  std::size_t source_line = 0;
};

struct Reference {
  Verb verb = Verb::kImpl;
  std::string prefix;
  std::string rule_id;
  std::string file;
  std::size_t line = 0;
  std::optional<std::string> captured_fingerprint;
  std::string spec;
  std::string impl;
  std::size_t unit_start_line = 0;
};

struct CodeUnit {
  std::string file;
  std::size_t start_line = 0;
  std::size_t end_line = 0;
  UnitKind kind = UnitKind::kLine;
  std::optional<std::string> name;
  std::set<std::string> rule_refs;

  bool Contains(std::size_t line) const {
    return start_line <= line && line <= end_line;
  }
  std::size_t Span() const { return end_line - start_line; }
};

struct RuleCoverage {
  std::string id;
  std::vector<Rule> declarations;
  std::vector<Reference> impl_refs;
  std::vector<Reference> verify_refs;
  std::vector<Reference> depends_refs;
  std::vector<Reference> related_refs;
};

struct SpecIndex {
  std::string name;
  std::string prefix;
  std::vector<std::string> documents;
  std::map<std::string, RuleCoverage> rules;
};

struct FileCoverage {
  std::string path;
  std::vector<std::string> lines;
  std::vector<CodeUnit> units;
  std::size_t total_units = 0;
  std::size_t covered_units = 0;
};

struct Finding {
  FindingKind kind = FindingKind::kConfigError;
  std::string message;
  std::string rule_id;
  std::string spec;
  std::string impl;
  std::vector<SourceSite> sites;
};

struct StaleReference {
  Reference reference;
  std::string current_fingerprint;
};

struct Pairing {
  std::string spec;
  std::string impl;
  std::vector<std::string> files;
  std::set<std::string> test_files;

  std::string Key() const { return spec + "/" + impl; }
};

// An annotation the builder could not attach cleanly; the validator turns
// these into findings.
struct AnnotationProblem {
  AnnotationIssue issue = AnnotationIssue::kMalformed;
  std::string file;
  std::size_t line = 0;
  std::string prefix;
  std::string rule_id;
  std::string detail;
  std::string spec;
  std::string impl;
};

struct IndexSnapshot {
  std::uint64_t version = 0;
  TraceConfig config;
  std::map<std::string, SpecIndex> forward;
  std::map<std::string, FileCoverage> reverse;
  std::vector<Pairing> pairings;
  // References whose rule id exists in no reachable spec.
  std::vector<Reference> unresolved;
  std::vector<AnnotationProblem> problems;
  std::vector<Finding> findings;
  std::vector<StaleReference> stale;
};

} // namespace reqtrace
