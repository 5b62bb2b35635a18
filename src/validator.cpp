#include <reqtrace/validator.h>

#include <algorithm>
#include <map>
#include <tuple>
#include <utility>

namespace reqtrace {
namespace {

FindingKind KindFor(AnnotationIssue issue) {
  switch (issue) {
  case AnnotationIssue::kMalformed:
    return FindingKind::kMalformedAnnotation;
  case AnnotationIssue::kUnknownPrefix:
  case AnnotationIssue::kAmbiguousPrefix:
    return FindingKind::kPrefixMismatch;
  case AnnotationIssue::kImplInTestFile:
    break;
  }
  return FindingKind::kImplInTestFile;
}

void AddSharedPrefixFindings(const TraceConfig &config,
                             std::vector<Finding> &findings) {
  std::map<std::string, std::vector<std::string>> specs_by_prefix;
  for (const auto &spec : config.specs) {
    specs_by_prefix[spec.prefix].push_back(spec.name);
  }
  for (const auto &[prefix, specs] : specs_by_prefix) {
    if (specs.size() < 2) {
      continue;
    }
    std::string names;
    for (const auto &name : specs) {
      names += names.empty() ? name : ", " + name;
    }
    Finding finding;
    finding.kind = FindingKind::kPrefixMismatch;
    finding.message = "Specs " + names + " share prefix '" + prefix + "'";
    finding.spec = names;
    findings.push_back(std::move(finding));
  }
}

void AddDuplicateFindings(const IndexSnapshot &snapshot,
                          std::vector<Finding> &findings) {
  for (const auto &[spec_name, spec] : snapshot.forward) {
    for (const auto &[rule_id, coverage] : spec.rules) {
      if (coverage.declarations.size() < 2) {
        continue;
      }
      Finding finding;
      finding.kind = FindingKind::kDuplicateRuleId;
      finding.message = "Rule '" + rule_id + "' is declared " +
                        std::to_string(coverage.declarations.size()) +
                        " times in spec '" + spec_name + "'";
      finding.rule_id = rule_id;
      finding.spec = spec_name;
      for (const auto &rule : coverage.declarations) {
        finding.sites.push_back({rule.source_file, rule.source_line});
      }
      findings.push_back(std::move(finding));
    }
  }
}

void AddReferenceFindings(const IndexSnapshot &snapshot,
                          std::vector<Finding> &findings) {
  for (const auto &reference : snapshot.unresolved) {
    Finding finding;
    finding.kind = FindingKind::kBrokenReference;
    finding.message = "Rule '" + reference.rule_id + "' referenced by " +
                      VerbName(reference.verb) + " does not exist in spec '" +
                      reference.spec + "'";
    finding.rule_id = reference.rule_id;
    finding.spec = reference.spec;
    finding.impl = reference.impl;
    finding.sites.push_back({reference.file, reference.line});
    findings.push_back(std::move(finding));
  }

  for (const auto &problem : snapshot.problems) {
    Finding finding;
    finding.kind = KindFor(problem.issue);
    finding.message = problem.prefix + "[" + problem.rule_id + "]: " +
                      problem.detail;
    finding.rule_id = problem.rule_id;
    finding.spec = problem.spec;
    finding.impl = problem.impl;
    finding.sites.push_back({problem.file, problem.line});
    findings.push_back(std::move(finding));
  }

  for (const auto &stale : snapshot.stale) {
    const auto &reference = stale.reference;
    Finding finding;
    finding.kind = FindingKind::kStale;
    finding.message = "Reference to '" + reference.rule_id +
                      "' captured fingerprint " +
                      reference.captured_fingerprint.value_or("") +
                      " but the rule is now " + stale.current_fingerprint;
    finding.rule_id = reference.rule_id;
    finding.spec = reference.spec;
    finding.impl = reference.impl;
    finding.sites.push_back({reference.file, reference.line});
    findings.push_back(std::move(finding));
  }
}

} // namespace

Validator::Validator(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

void Validator::Validate(IndexSnapshot &snapshot) const {
  auto findings = std::move(snapshot.findings);
  findings.erase(std::remove_if(findings.begin(), findings.end(),
                                [](const Finding &finding) {
                                  return finding.kind !=
                                         FindingKind::kConfigError;
                                }),
                 findings.end());

  AddSharedPrefixFindings(snapshot.config, findings);
  AddDuplicateFindings(snapshot, findings);
  AddReferenceFindings(snapshot, findings);
  SortFindings(findings);
  snapshot.findings = std::move(findings);

  logger_->Log(LogLevel::kDebug, "validate.complete",
               {{"findings", std::to_string(snapshot.findings.size())}});
}

void SortFindings(std::vector<Finding> &findings) {
  const auto key = [](const Finding &finding) {
    const SourceSite empty{};
    const auto &site = finding.sites.empty() ? empty : finding.sites.front();
    return std::make_tuple(static_cast<int>(finding.kind), finding.spec,
                           finding.rule_id, site.file, site.line,
                           finding.message);
  };
  std::stable_sort(findings.begin(), findings.end(),
                   [&](const Finding &left, const Finding &right) {
                     return key(left) < key(right);
                   });
}

} // namespace reqtrace
