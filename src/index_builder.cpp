#include <reqtrace/index_builder.h>

#include <algorithm>
#include <set>
#include <utility>

namespace reqtrace {
namespace {

std::vector<Reference> &RefsForVerb(RuleCoverage &coverage, Verb verb) {
  switch (verb) {
  case Verb::kImpl:
    return coverage.impl_refs;
  case Verb::kVerify:
    return coverage.verify_refs;
  case Verb::kDepends:
    return coverage.depends_refs;
  case Verb::kRelated:
    break;
  }
  return coverage.related_refs;
}

// Prose such as `see items[0]` looks like an annotation with an unknown
// prefix; only report ones that plausibly meant to be annotations.
bool LooksIntentional(const RawAnnotation &annotation) {
  return annotation.explicit_verb ||
         annotation.rule_id.find('.') != std::string::npos;
}

AnnotationProblem MakeProblem(AnnotationIssue issue,
                              const RawAnnotation &annotation,
                              const std::string &file, std::string detail) {
  AnnotationProblem problem;
  problem.issue = issue;
  problem.file = file;
  problem.line = annotation.line;
  problem.prefix = annotation.prefix;
  problem.rule_id = annotation.rule_id;
  problem.detail = std::move(detail);
  return problem;
}

} // namespace

IndexBuilder::IndexBuilder(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

IndexSnapshot IndexBuilder::Build(const TraceConfig &config,
                                  BuildInputs inputs) const {
  IndexSnapshot snapshot;
  snapshot.config = config;
  snapshot.pairings = std::move(inputs.resolution.pairings);
  snapshot.findings = std::move(inputs.resolution.findings);

  std::map<std::string, std::string> prefix_by_spec;
  std::set<std::string> known_prefixes;
  for (const auto &spec : config.specs) {
    known_prefixes.insert(spec.prefix);
  }

  for (auto &resolved : inputs.resolution.specs) {
    SpecIndex index{resolved.name, resolved.prefix,
                    std::move(resolved.documents), {}};
    for (auto &rule : inputs.rules[resolved.name]) {
      auto &coverage = index.rules[rule.id];
      coverage.id = rule.id;
      coverage.declarations.push_back(std::move(rule));
    }
    prefix_by_spec[resolved.name] = resolved.prefix;
    snapshot.forward.emplace(resolved.name, std::move(index));
  }

  std::map<std::string, std::vector<const Pairing *>> owners;
  for (const auto &pairing : snapshot.pairings) {
    for (const auto &file : pairing.files) {
      owners[file].push_back(&pairing);
    }
  }

  std::size_t reference_count = 0;
  for (auto &[path, scanned] : inputs.files) {
    FileCoverage coverage{path, std::move(scanned.lines),
                          std::move(scanned.units), 0, 0};
    const auto &file_owners = owners[path];

    for (const auto &annotation : scanned.annotations) {
      std::set<std::string> candidates;
      for (const auto *pairing : file_owners) {
        if (prefix_by_spec[pairing->spec] == annotation.prefix) {
          candidates.insert(pairing->spec);
        }
      }
      const bool known = known_prefixes.count(annotation.prefix) != 0;

      if (annotation.IsMalformed()) {
        if (!candidates.empty() || known) {
          auto problem = MakeProblem(AnnotationIssue::kMalformed, annotation,
                                     path, annotation.problem);
          if (candidates.size() == 1) {
            problem.spec = *candidates.begin();
          }
          snapshot.problems.push_back(std::move(problem));
        }
        continue;
      }
      if (candidates.size() > 1) {
        snapshot.problems.push_back(MakeProblem(
            AnnotationIssue::kAmbiguousPrefix, annotation, path,
            "prefix '" + annotation.prefix +
                "' is shared by several specs owning this file"));
        continue;
      }
      if (candidates.empty()) {
        if (known || LooksIntentional(annotation)) {
          snapshot.problems.push_back(MakeProblem(
              AnnotationIssue::kUnknownPrefix, annotation, path,
              "prefix '" + annotation.prefix +
                  "' matches no spec owning this file"));
        }
        continue;
      }

      const auto &spec_name = *candidates.begin();
      auto &spec = snapshot.forward.at(spec_name);
      auto &unit = coverage.units[annotation.unit_index];
      for (const auto *pairing : file_owners) {
        if (pairing->spec != spec_name) {
          continue;
        }
        Reference reference{*annotation.verb,
                            annotation.prefix,
                            annotation.rule_id,
                            path,
                            annotation.line,
                            annotation.fingerprint,
                            spec_name,
                            pairing->impl,
                            unit.start_line};
        if (*annotation.verb == Verb::kImpl &&
            pairing->test_files.count(path) != 0) {
          auto problem = MakeProblem(AnnotationIssue::kImplInTestFile,
                                     annotation, path,
                                     "impl annotation in a test file");
          problem.spec = spec_name;
          problem.impl = pairing->impl;
          snapshot.problems.push_back(std::move(problem));
          continue;
        }
        const auto rule = spec.rules.find(annotation.rule_id);
        if (rule == spec.rules.end()) {
          snapshot.unresolved.push_back(std::move(reference));
          continue;
        }
        RefsForVerb(rule->second, reference.verb)
            .push_back(std::move(reference));
        unit.rule_refs.insert(annotation.rule_id);
        ++reference_count;
      }
    }

    coverage.total_units = coverage.units.size();
    coverage.covered_units = static_cast<std::size_t>(
        std::count_if(coverage.units.begin(), coverage.units.end(),
                      [](const CodeUnit &unit) {
                        return !unit.rule_refs.empty();
                      }));
    snapshot.reverse.emplace(path, std::move(coverage));
  }

  logger_->Log(LogLevel::kDebug, "index.build.complete",
               {{"specs", std::to_string(snapshot.forward.size())},
                {"files", std::to_string(snapshot.reverse.size())},
                {"references", std::to_string(reference_count)},
                {"unresolved", std::to_string(snapshot.unresolved.size())},
                {"problems", std::to_string(snapshot.problems.size())}});
  return snapshot;
}

} // namespace reqtrace
