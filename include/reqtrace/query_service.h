#pragma once

#include <reqtrace/models.h>
#include <reqtrace/reload_controller.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace reqtrace {

struct PairingStatus {
  std::string spec;
  std::string impl;
  std::size_t total_rules = 0;
  std::size_t impl_covered = 0;
  std::size_t verify_covered = 0;
  double impl_percent = 0.0;
  double verify_percent = 0.0;
  std::size_t total_units = 0;
  std::size_t covered_units = 0;
  std::size_t stale = 0;
};

struct StatusReport {
  std::uint64_t version = 0;
  std::vector<PairingStatus> pairings;
};

struct RuleSummary {
  std::string spec;
  std::string impl;
  std::string id;
  std::optional<Level> level;
  std::string text;
  std::string source_file;
  std::size_t source_line = 0;
};

// Directory aggregates are sums over their children.
struct CoverageNode {
  std::string name;
  std::string path;
  bool is_file = false;
  std::size_t total_units = 0;
  std::size_t covered_units = 0;
  std::vector<CoverageNode> children;
};

struct UnmappedReport {
  CoverageNode tree;
  std::vector<CodeUnit> units;
};

struct RuleDeclaration {
  std::string spec;
  Rule rule;
};

struct RuleReport {
  std::string id;
  std::vector<RuleDeclaration> declarations;
  std::vector<Reference> impl_refs;
  std::vector<Reference> verify_refs;
  std::vector<Reference> depends_refs;
  std::vector<Reference> related_refs;
  std::vector<StaleReference> stale;
};

enum class SearchKind { kRule, kUnit };

struct SearchHit {
  SearchKind kind = SearchKind::kRule;
  // Rule id, or "path:start-end" for a code unit.
  std::string key;
  std::string spec;
  std::string file;
  std::size_t line = 0;
  std::string snippet;
  // 0 exact id, 1 substring, 2 fuzzy subsequence.
  int tier = 0;
  std::size_t position = 0;
  std::size_t match_length = 0;
};

struct ConfigSummary {
  std::uint64_t version = 0;
  TraceConfig config;
  std::vector<Pairing> pairings;
};

constexpr std::size_t kDefaultSearchLimit = 50;

// Read-only operations over the controller's current snapshot. Each call
// reads exactly one snapshot, so results are deterministic for it.
class QueryService {
public:
  explicit QueryService(const ReloadController &controller);

  StatusReport Status() const;
  // spec_impl is "spec/impl"; prefix filters rule ids. Unknown spec_impl
  // throws NotFoundError.
  std::vector<RuleSummary>
  Uncovered(const std::optional<std::string> &spec_impl = std::nullopt,
            const std::optional<std::string> &prefix = std::nullopt) const;
  std::vector<RuleSummary>
  Untested(const std::optional<std::string> &spec_impl = std::nullopt,
           const std::optional<std::string> &prefix = std::nullopt) const;
  std::vector<StaleReference>
  Stale(const std::optional<std::string> &spec_impl = std::nullopt,
        const std::optional<std::string> &prefix = std::nullopt) const;
  UnmappedReport
  Unmapped(const std::optional<std::string> &path = std::nullopt,
           const std::optional<std::string> &spec_impl = std::nullopt) const;
  // Throws NotFoundError when no spec declares id.
  RuleReport RuleDetail(const std::string &id) const;
  std::vector<Finding> Validate() const;
  std::vector<SearchHit> Search(const std::string &query,
                                std::size_t limit = kDefaultSearchLimit) const;
  ConfigSummary Config() const;

private:
  const ReloadController *controller_;
};

} // namespace reqtrace
