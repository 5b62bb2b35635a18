#include <reqtrace/query_service.h>

#include <reqtrace/errors.h>
#include <reqtrace/staleness.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <tuple>
#include <utility>

namespace reqtrace {
namespace {

constexpr std::size_t kSnippetLength = 120;

using SnapshotPtr = std::shared_ptr<const IndexSnapshot>;

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool StartsWith(const std::string &value, const std::string &prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

// "spec/impl" selects one pairing, a bare "spec" all of its pairings.
std::vector<const Pairing *>
SelectPairings(const IndexSnapshot &snapshot,
               const std::optional<std::string> &spec_impl) {
  std::vector<const Pairing *> selected;
  for (const auto &pairing : snapshot.pairings) {
    if (!spec_impl || pairing.Key() == *spec_impl ||
        (spec_impl->find('/') == std::string::npos &&
         pairing.spec == *spec_impl)) {
      selected.push_back(&pairing);
    }
  }
  if (spec_impl && selected.empty()) {
    throw NotFoundError("No active spec/impl pairing named '" + *spec_impl +
                        "'");
  }
  return selected;
}

bool HasRefForImpl(const std::vector<Reference> &references,
                   const std::string &impl) {
  return std::any_of(
      references.begin(), references.end(),
      [&](const Reference &reference) { return reference.impl == impl; });
}

double Percent(std::size_t covered, std::size_t total) {
  return total == 0 ? 0.0
                    : 100.0 * static_cast<double>(covered) /
                          static_cast<double>(total);
}

RuleSummary Summarize(const Pairing &pairing, const RuleCoverage &coverage) {
  RuleSummary summary;
  summary.spec = pairing.spec;
  summary.impl = pairing.impl;
  summary.id = coverage.id;
  if (!coverage.declarations.empty()) {
    const auto &rule = coverage.declarations.front();
    summary.level = rule.level;
    summary.text = rule.text;
    summary.source_file = rule.source_file;
    summary.source_line = rule.source_line;
  }
  return summary;
}

template <typename Predicate>
std::vector<RuleSummary>
CollectRules(const IndexSnapshot &snapshot,
             const std::optional<std::string> &spec_impl,
             const std::optional<std::string> &prefix, Predicate missing) {
  std::vector<RuleSummary> rules;
  for (const auto *pairing : SelectPairings(snapshot, spec_impl)) {
    const auto spec = snapshot.forward.find(pairing->spec);
    if (spec == snapshot.forward.end()) {
      continue;
    }
    for (const auto &[id, coverage] : spec->second.rules) {
      if (prefix && !StartsWith(id, *prefix)) {
        continue;
      }
      if (missing(coverage, pairing->impl)) {
        rules.push_back(Summarize(*pairing, coverage));
      }
    }
  }
  return rules;
}

std::string NormalizeQueryPath(std::string path) {
  while (StartsWith(path, "./")) {
    path.erase(0, 2);
  }
  while (!path.empty() && path.back() == '/') {
    path.pop_back();
  }
  return path == "." ? "" : path;
}

bool IsUnder(const std::string &file, const std::string &path) {
  return path.empty() || file == path ||
         (StartsWith(file, path) && file.size() > path.size() &&
          file[path.size()] == '/');
}

CoverageNode &ChildNamed(CoverageNode &parent, const std::string &name) {
  const auto found =
      std::find_if(parent.children.begin(), parent.children.end(),
                   [&](const CoverageNode &child) { return child.name == name; });
  if (found != parent.children.end()) {
    return *found;
  }
  CoverageNode child;
  child.name = name;
  child.path = parent.path.empty() ? name : parent.path + "/" + name;
  parent.children.push_back(std::move(child));
  return parent.children.back();
}

// Directory totals are recomputed from the children, never stored twice.
void Aggregate(CoverageNode &node) {
  if (node.is_file) {
    return;
  }
  std::sort(node.children.begin(), node.children.end(),
            [](const CoverageNode &left, const CoverageNode &right) {
              return left.name < right.name;
            });
  node.total_units = 0;
  node.covered_units = 0;
  for (auto &child : node.children) {
    Aggregate(child);
    node.total_units += child.total_units;
    node.covered_units += child.covered_units;
  }
}

std::vector<std::string> SplitPath(const std::string &path) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (start <= path.size()) {
    const auto slash = path.find('/', start);
    if (slash == std::string::npos) {
      parts.push_back(path.substr(start));
      break;
    }
    parts.push_back(path.substr(start, slash - start));
    start = slash + 1;
  }
  return parts;
}

// Sorts first by tier, then by position, then by match length; lower wins.
struct Match {
  int tier = 0;
  std::size_t position = 0;
  std::size_t length = 0;

  bool operator<(const Match &other) const {
    return std::tie(tier, position, length) <
           std::tie(other.tier, other.position, other.length);
  }
};

std::optional<Match> FuzzyMatch(const std::string &field,
                                const std::string &query) {
  std::size_t cursor = 0;
  std::optional<std::size_t> first;
  for (const auto character : query) {
    cursor = field.find(character, cursor);
    if (cursor == std::string::npos) {
      return std::nullopt;
    }
    if (!first) {
      first = cursor;
    }
    ++cursor;
  }
  return Match{2, first.value_or(0), cursor - first.value_or(0)};
}

std::optional<Match> MatchField(const std::string &field,
                                const std::string &query, bool exact_tier,
                                bool fuzzy) {
  const auto lowered = ToLower(field);
  if (exact_tier && lowered == query) {
    return Match{0, 0, field.size()};
  }
  if (const auto position = lowered.find(query); position != std::string::npos) {
    return Match{1, position, field.size()};
  }
  return fuzzy ? FuzzyMatch(lowered, query) : std::nullopt;
}

std::optional<Match> Best(std::optional<Match> left,
                          std::optional<Match> right) {
  if (!left) {
    return right;
  }
  if (!right) {
    return left;
  }
  return *right < *left ? right : left;
}

std::string Snippet(const std::string &text) {
  auto normalized = NormalizeRuleText(text);
  if (normalized.size() > kSnippetLength) {
    normalized = normalized.substr(0, kSnippetLength) + "...";
  }
  return normalized;
}

void SearchRules(const IndexSnapshot &snapshot, const std::string &query,
                 std::vector<SearchHit> &hits) {
  for (const auto &[spec_name, spec] : snapshot.forward) {
    for (const auto &[id, coverage] : spec.rules) {
      const auto &rule = coverage.declarations.front();
      const auto match = Best(MatchField(id, query, true, true),
                              MatchField(rule.text, query, false, false));
      if (!match) {
        continue;
      }
      hits.push_back({SearchKind::kRule, id, spec_name, rule.source_file,
                      rule.source_line, Snippet(rule.text), match->tier,
                      match->position, match->length});
    }
  }
}

void SearchUnits(const IndexSnapshot &snapshot, const std::string &query,
                 std::vector<SearchHit> &hits) {
  for (const auto &[path, file] : snapshot.reverse) {
    for (const auto &unit : file.units) {
      std::optional<Match> match;
      if (unit.name) {
        match = MatchField(*unit.name, query, true, true);
      }
      std::string snippet = unit.name.value_or("");
      for (auto line = unit.start_line;
           line <= unit.end_line && line <= file.lines.size(); ++line) {
        const auto &text = file.lines[line - 1];
        const auto line_match = MatchField(text, query, false, false);
        if (line_match && (!match || *line_match < *match)) {
          match = line_match;
          snippet = Snippet(text);
        }
      }
      if (!match) {
        continue;
      }
      hits.push_back({SearchKind::kUnit,
                      path + ":" + std::to_string(unit.start_line) + "-" +
                          std::to_string(unit.end_line),
                      "", path, unit.start_line, snippet, match->tier,
                      match->position, match->length});
    }
  }
}

} // namespace

QueryService::QueryService(const ReloadController &controller)
    : controller_(&controller) {}

StatusReport QueryService::Status() const {
  const SnapshotPtr snapshot = controller_->Current();
  StatusReport report;
  report.version = snapshot->version;
  for (const auto &pairing : snapshot->pairings) {
    PairingStatus status;
    status.spec = pairing.spec;
    status.impl = pairing.impl;
    const auto spec = snapshot->forward.find(pairing.spec);
    if (spec != snapshot->forward.end()) {
      for (const auto &[id, coverage] : spec->second.rules) {
        ++status.total_rules;
        status.impl_covered += HasRefForImpl(coverage.impl_refs, pairing.impl);
        status.verify_covered +=
            HasRefForImpl(coverage.verify_refs, pairing.impl);
      }
    }
    status.impl_percent = Percent(status.impl_covered, status.total_rules);
    status.verify_percent = Percent(status.verify_covered, status.total_rules);
    for (const auto &file : pairing.files) {
      const auto coverage = snapshot->reverse.find(file);
      if (coverage != snapshot->reverse.end()) {
        status.total_units += coverage->second.total_units;
        status.covered_units += coverage->second.covered_units;
      }
    }
    status.stale = static_cast<std::size_t>(std::count_if(
        snapshot->stale.begin(), snapshot->stale.end(),
        [&](const StaleReference &stale) {
          return stale.reference.spec == pairing.spec &&
                 stale.reference.impl == pairing.impl;
        }));
    report.pairings.push_back(std::move(status));
  }
  return report;
}

std::vector<RuleSummary>
QueryService::Uncovered(const std::optional<std::string> &spec_impl,
                        const std::optional<std::string> &prefix) const {
  const SnapshotPtr snapshot = controller_->Current();
  return CollectRules(*snapshot, spec_impl, prefix,
                      [](const RuleCoverage &coverage, const std::string &impl) {
                        return !HasRefForImpl(coverage.impl_refs, impl);
                      });
}

std::vector<RuleSummary>
QueryService::Untested(const std::optional<std::string> &spec_impl,
                       const std::optional<std::string> &prefix) const {
  const SnapshotPtr snapshot = controller_->Current();
  return CollectRules(*snapshot, spec_impl, prefix,
                      [](const RuleCoverage &coverage, const std::string &impl) {
                        return !HasRefForImpl(coverage.verify_refs, impl);
                      });
}

std::vector<StaleReference>
QueryService::Stale(const std::optional<std::string> &spec_impl,
                    const std::optional<std::string> &prefix) const {
  const SnapshotPtr snapshot = controller_->Current();
  const auto pairings = SelectPairings(*snapshot, spec_impl);
  std::vector<StaleReference> stale;
  for (const auto &entry : snapshot->stale) {
    const auto &reference = entry.reference;
    const bool selected = std::any_of(
        pairings.begin(), pairings.end(), [&](const Pairing *pairing) {
          return pairing->spec == reference.spec &&
                 pairing->impl == reference.impl;
        });
    if (selected && (!prefix || StartsWith(reference.rule_id, *prefix))) {
      stale.push_back(entry);
    }
  }
  return stale;
}

UnmappedReport
QueryService::Unmapped(const std::optional<std::string> &path,
                       const std::optional<std::string> &spec_impl) const {
  const SnapshotPtr snapshot = controller_->Current();
  const auto scope = NormalizeQueryPath(path.value_or(""));

  std::set<std::string> files;
  for (const auto *pairing : SelectPairings(*snapshot, spec_impl)) {
    for (const auto &file : pairing->files) {
      if (IsUnder(file, scope) && snapshot->reverse.count(file) != 0) {
        files.insert(file);
      }
    }
  }
  if (!scope.empty() && files.empty()) {
    throw NotFoundError("No indexed source files under '" + scope + "'");
  }

  UnmappedReport report;
  report.tree.name = ".";
  for (const auto &file : files) {
    const auto &coverage = snapshot->reverse.at(file);
    auto *node = &report.tree;
    for (const auto &part : SplitPath(file)) {
      node = &ChildNamed(*node, part);
    }
    node->is_file = true;
    node->total_units = coverage.total_units;
    node->covered_units = coverage.covered_units;

    for (const auto &unit : coverage.units) {
      if (unit.rule_refs.empty()) {
        report.units.push_back(unit);
      }
    }
  }
  Aggregate(report.tree);

  if (!scope.empty()) {
    for (const auto &part : SplitPath(scope)) {
      CoverageNode next = std::move(ChildNamed(report.tree, part));
      report.tree = std::move(next);
    }
  }
  return report;
}

RuleReport QueryService::RuleDetail(const std::string &id) const {
  const SnapshotPtr snapshot = controller_->Current();
  RuleReport report;
  report.id = id;
  for (const auto &[spec_name, spec] : snapshot->forward) {
    const auto found = spec.rules.find(id);
    if (found == spec.rules.end()) {
      continue;
    }
    const auto &coverage = found->second;
    for (const auto &rule : coverage.declarations) {
      report.declarations.push_back({spec_name, rule});
    }
    const auto append = [](std::vector<Reference> &into,
                           const std::vector<Reference> &from) {
      into.insert(into.end(), from.begin(), from.end());
    };
    append(report.impl_refs, coverage.impl_refs);
    append(report.verify_refs, coverage.verify_refs);
    append(report.depends_refs, coverage.depends_refs);
    append(report.related_refs, coverage.related_refs);
  }
  if (report.declarations.empty()) {
    throw NotFoundError("Rule '" + id + "' is not declared in any spec");
  }
  for (const auto &stale : snapshot->stale) {
    if (stale.reference.rule_id == id) {
      report.stale.push_back(stale);
    }
  }
  return report;
}

std::vector<Finding> QueryService::Validate() const {
  return controller_->Current()->findings;
}

std::vector<SearchHit> QueryService::Search(const std::string &query,
                                            std::size_t limit) const {
  const SnapshotPtr snapshot = controller_->Current();
  const auto needle = ToLower(NormalizeRuleText(query));
  std::vector<SearchHit> hits;
  if (needle.empty() || limit == 0) {
    return hits;
  }

  SearchRules(*snapshot, needle, hits);
  SearchUnits(*snapshot, needle, hits);
  std::sort(hits.begin(), hits.end(),
            [](const SearchHit &left, const SearchHit &right) {
              return std::tie(left.tier, left.position, left.match_length,
                              left.key, left.spec) <
                     std::tie(right.tier, right.position, right.match_length,
                              right.key, right.spec);
            });
  if (hits.size() > limit) {
    hits.resize(limit);
  }
  return hits;
}

ConfigSummary QueryService::Config() const {
  const SnapshotPtr snapshot = controller_->Current();
  return {snapshot->version, snapshot->config, snapshot->pairings};
}

} // namespace reqtrace
