#include <reqtrace/report_renderer.h>

#include <reqtrace/escaping.h>

#include <iomanip>
#include <sstream>

namespace reqtrace {
namespace {

std::string FormatPercent(double percent) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(1) << percent << "%";
  return stream.str();
}

std::string Cell(const std::string &value) {
  return value.empty() ? "-" : EscapeMarkdownCell(value);
}

std::string Site(const std::string &file, std::size_t line) {
  return file + ":" + std::to_string(line);
}

std::string LevelText(const std::optional<Level> &level) {
  return level ? LevelName(*level) : "";
}

std::string JoinSites(const std::vector<SourceSite> &sites,
                      const std::string &delimiter) {
  std::vector<std::string> rendered;
  for (const auto &site : sites) {
    rendered.push_back(Site(site.file, site.line));
  }
  return JoinStrings(rendered, delimiter);
}

void RenderTreeMarkdown(const CoverageNode &node, std::size_t depth,
                        std::ostringstream &output) {
  output << std::string(depth * 2, ' ') << "- " << node.name
         << (node.is_file ? "" : "/") << " " << node.covered_units << "/"
         << node.total_units << " units ("
         << FormatPercent(node.total_units == 0
                              ? 0.0
                              : 100.0 * static_cast<double>(node.covered_units) /
                                    static_cast<double>(node.total_units))
         << ")\n";
  for (const auto &child : node.children) {
    RenderTreeMarkdown(child, depth + 1, output);
  }
}

void RenderReferencesMarkdown(const std::string &title,
                              const std::vector<Reference> &references,
                              std::ostringstream &output) {
  output << "### " << title << "\n\n";
  if (references.empty()) {
    output << "- None\n\n";
    return;
  }
  for (const auto &reference : references) {
    output << "- " << Site(reference.file, reference.line) << " ("
           << reference.spec << "/" << reference.impl << ")";
    if (reference.captured_fingerprint) {
      output << " @" << *reference.captured_fingerprint;
    }
    output << "\n";
  }
  output << "\n";
}

std::string Quote(const std::string &value) {
  return "\"" + EscapeJsonString(value) + "\"";
}

std::string OptionalQuote(const std::optional<std::string> &value) {
  return value ? Quote(*value) : "null";
}

std::string QuoteList(const std::vector<std::string> &values) {
  std::vector<std::string> quoted;
  for (const auto &value : values) {
    quoted.push_back(Quote(value));
  }
  return "[" + JoinStrings(quoted, ",") + "]";
}

std::string JsonLevel(const std::optional<Level> &level) {
  return level ? Quote(LevelName(*level)) : "null";
}

std::string JsonReference(const Reference &reference) {
  std::ostringstream json;
  json << "{\"verb\": " << Quote(VerbName(reference.verb)) << ",";
  json << "\"prefix\": " << Quote(reference.prefix) << ",";
  json << "\"rule_id\": " << Quote(reference.rule_id) << ",";
  json << "\"file\": " << Quote(reference.file) << ",";
  json << "\"line\": " << reference.line << ",";
  json << "\"spec\": " << Quote(reference.spec) << ",";
  json << "\"impl\": " << Quote(reference.impl) << ",";
  json << "\"unit_start_line\": " << reference.unit_start_line << ",";
  json << "\"captured_fingerprint\": "
       << OptionalQuote(reference.captured_fingerprint) << "}";
  return json.str();
}

std::string JsonReferences(const std::vector<Reference> &references) {
  std::vector<std::string> rendered;
  for (const auto &reference : references) {
    rendered.push_back(JsonReference(reference));
  }
  return "[" + JoinStrings(rendered, ",") + "]";
}

std::string JsonStale(const std::vector<StaleReference> &stale) {
  std::vector<std::string> rendered;
  for (const auto &entry : stale) {
    rendered.push_back("{\"reference\": " + JsonReference(entry.reference) +
                       ",\"current_fingerprint\": " +
                       Quote(entry.current_fingerprint) + "}");
  }
  return "[" + JoinStrings(rendered, ",") + "]";
}

std::string JsonUnit(const CodeUnit &unit) {
  std::ostringstream json;
  json << "{\"file\": " << Quote(unit.file) << ",";
  json << "\"start_line\": " << unit.start_line << ",";
  json << "\"end_line\": " << unit.end_line << ",";
  json << "\"kind\": " << Quote(UnitKindName(unit.kind)) << ",";
  json << "\"name\": " << OptionalQuote(unit.name) << ",";
  json << "\"rule_refs\": "
       << QuoteList({unit.rule_refs.begin(), unit.rule_refs.end()}) << "}";
  return json.str();
}

std::string JsonTree(const CoverageNode &node) {
  std::vector<std::string> children;
  for (const auto &child : node.children) {
    children.push_back(JsonTree(child));
  }
  std::ostringstream json;
  json << "{\"name\": " << Quote(node.name) << ",";
  json << "\"path\": " << Quote(node.path) << ",";
  json << "\"is_file\": " << (node.is_file ? "true" : "false") << ",";
  json << "\"total_units\": " << node.total_units << ",";
  json << "\"covered_units\": " << node.covered_units << ",";
  json << "\"children\": [" << JoinStrings(children, ",") << "]}";
  return json.str();
}

} // namespace

std::string
MarkdownReportRenderer::RenderStatus(const StatusReport &status) const {
  std::ostringstream output;
  output << "# Coverage Status (version " << status.version << ")\n\n";
  output << "| Spec/Impl | Rules | Impl | Verify | Units | Stale |\n";
  output << "| --- | --- | --- | --- | --- | --- |\n";
  if (status.pairings.empty()) {
    output << "| None | - | - | - | - | - |\n";
    return output.str();
  }
  for (const auto &pairing : status.pairings) {
    output << "| " << Cell(pairing.spec + "/" + pairing.impl) << " | "
           << pairing.total_rules << " | " << pairing.impl_covered << " ("
           << FormatPercent(pairing.impl_percent) << ") | "
           << pairing.verify_covered << " ("
           << FormatPercent(pairing.verify_percent) << ") | "
           << pairing.covered_units << "/" << pairing.total_units << " | "
           << pairing.stale << " |\n";
  }
  return output.str();
}

std::string
MarkdownReportRenderer::RenderRules(const std::string &title,
                                    const std::vector<RuleSummary> &rules) const {
  std::ostringstream output;
  output << "## " << title << "\n\n";
  output << "| Spec/Impl | Rule | Level | Text | Source |\n";
  output << "| --- | --- | --- | --- | --- |\n";
  if (rules.empty()) {
    output << "| None | - | - | - | - |\n";
    return output.str();
  }
  for (const auto &rule : rules) {
    output << "| " << Cell(rule.spec + "/" + rule.impl) << " | "
           << Cell(rule.id) << " | " << Cell(LevelText(rule.level)) << " | "
           << Cell(rule.text) << " | "
           << Cell(Site(rule.source_file, rule.source_line)) << " |\n";
  }
  return output.str();
}

std::string MarkdownReportRenderer::RenderStale(
    const std::vector<StaleReference> &stale) const {
  std::ostringstream output;
  output << "## Stale References\n\n";
  output << "| Spec/Impl | Rule | Location | Captured | Current |\n";
  output << "| --- | --- | --- | --- | --- |\n";
  if (stale.empty()) {
    output << "| None | - | - | - | - |\n";
    return output.str();
  }
  for (const auto &entry : stale) {
    const auto &reference = entry.reference;
    output << "| " << Cell(reference.spec + "/" + reference.impl) << " | "
           << Cell(reference.rule_id) << " | "
           << Cell(Site(reference.file, reference.line)) << " | "
           << Cell(reference.captured_fingerprint.value_or("")) << " | "
           << Cell(entry.current_fingerprint) << " |\n";
  }
  return output.str();
}

std::string
MarkdownReportRenderer::RenderUnmapped(const UnmappedReport &report) const {
  std::ostringstream output;
  output << "## Coverage Tree\n\n";
  RenderTreeMarkdown(report.tree, 0, output);
  output << "\n## Unmapped Units\n\n";
  output << "| Location | Kind | Name |\n";
  output << "| --- | --- | --- |\n";
  if (report.units.empty()) {
    output << "| None | - | - |\n";
    return output.str();
  }
  for (const auto &unit : report.units) {
    output << "| "
           << Cell(unit.file + ":" + std::to_string(unit.start_line) + "-" +
                   std::to_string(unit.end_line))
           << " | " << UnitKindName(unit.kind) << " | "
           << Cell(unit.name.value_or("")) << " |\n";
  }
  return output.str();
}

std::string MarkdownReportRenderer::RenderRuleDetails(
    const std::vector<RuleReport> &rules) const {
  std::ostringstream output;
  for (const auto &rule : rules) {
    output << "## " << rule.id << "\n\n";
    for (const auto &declaration : rule.declarations) {
      output << "- Spec: " << declaration.spec << "\n";
      output << "- Defined at: "
             << Site(declaration.rule.source_file, declaration.rule.source_line)
             << "\n";
      output << "- Level: "
             << (declaration.rule.level ? LevelName(*declaration.rule.level)
                                        : "-")
             << "\n";
      if (declaration.rule.status) {
        output << "- Status: " << *declaration.rule.status << "\n";
      }
      output << "- Fingerprint: " << declaration.rule.fingerprint << "\n\n";
      output << (declaration.rule.text.empty() ? "(no text)"
                                               : declaration.rule.text)
             << "\n\n";
    }
    RenderReferencesMarkdown("Implementations", rule.impl_refs, output);
    RenderReferencesMarkdown("Verifications", rule.verify_refs, output);
    RenderReferencesMarkdown("Depends", rule.depends_refs, output);
    RenderReferencesMarkdown("Related", rule.related_refs, output);
    if (!rule.stale.empty()) {
      output << "### Stale\n\n";
      for (const auto &entry : rule.stale) {
        output << "- "
               << Site(entry.reference.file, entry.reference.line)
               << " captured "
               << entry.reference.captured_fingerprint.value_or("")
               << ", current " << entry.current_fingerprint << "\n";
      }
      output << "\n";
    }
  }
  return output.str();
}

std::string MarkdownReportRenderer::RenderFindings(
    const std::vector<Finding> &findings) const {
  std::ostringstream output;
  output << "## Validation Findings\n\n";
  output << "| Kind | Spec/Impl | Rule | Sites | Message |\n";
  output << "| --- | --- | --- | --- | --- |\n";
  if (findings.empty()) {
    output << "| None | - | - | - | - |\n";
    return output.str();
  }
  for (const auto &finding : findings) {
    const auto scope =
        finding.impl.empty() ? finding.spec : finding.spec + "/" + finding.impl;
    output << "| " << FindingKindName(finding.kind) << " | " << Cell(scope)
           << " | " << Cell(finding.rule_id) << " | "
           << Cell(JoinSites(finding.sites, "<br>")) << " | "
           << Cell(finding.message) << " |\n";
  }
  return output.str();
}

std::string
MarkdownReportRenderer::RenderSearch(const std::vector<SearchHit> &hits) const {
  std::ostringstream output;
  output << "## Search Results\n\n";
  output << "| Kind | Match | Location | Snippet |\n";
  output << "| --- | --- | --- | --- |\n";
  if (hits.empty()) {
    output << "| None | - | - | - |\n";
    return output.str();
  }
  for (const auto &hit : hits) {
    output << "| " << (hit.kind == SearchKind::kRule ? "rule" : "unit")
           << " | " << Cell(hit.key) << " | " << Cell(Site(hit.file, hit.line))
           << " | " << Cell(hit.snippet) << " |\n";
  }
  return output.str();
}

std::string
MarkdownReportRenderer::RenderConfig(const ConfigSummary &summary) const {
  std::ostringstream output;
  output << "# Configuration (version " << summary.version << ")\n\n";
  output << "Root: " << summary.config.root_path << "\n\n";
  for (const auto &spec : summary.config.specs) {
    output << "## " << spec.name << " (prefix `" << spec.prefix << "`)\n\n";
    output << "- Documents: " << JoinStrings(spec.include, ", ") << "\n";
    for (const auto &impl : spec.impls) {
      output << "- Impl `" << impl.name << "`\n";
      output << "  - include: " << JoinStrings(impl.include, ", ") << "\n";
      if (!impl.exclude.empty()) {
        output << "  - exclude: " << JoinStrings(impl.exclude, ", ") << "\n";
      }
      if (!impl.test_include.empty()) {
        output << "  - test_include: " << JoinStrings(impl.test_include, ", ")
               << "\n";
      }
    }
    output << "\n";
  }
  output << "## Active Pairings\n\n";
  if (summary.pairings.empty()) {
    output << "- None\n";
  }
  for (const auto &pairing : summary.pairings) {
    output << "- " << pairing.Key() << ": " << pairing.files.size()
           << " files (" << pairing.test_files.size() << " test)\n";
  }
  return output.str();
}

std::string JsonReportRenderer::RenderStatus(const StatusReport &status) const {
  std::vector<std::string> pairings;
  for (const auto &pairing : status.pairings) {
    std::ostringstream json;
    json << "{\"spec\": " << Quote(pairing.spec) << ",";
    json << "\"impl\": " << Quote(pairing.impl) << ",";
    json << "\"total_rules\": " << pairing.total_rules << ",";
    json << "\"impl_covered\": " << pairing.impl_covered << ",";
    json << "\"verify_covered\": " << pairing.verify_covered << ",";
    json << "\"impl_percent\": " << pairing.impl_percent << ",";
    json << "\"verify_percent\": " << pairing.verify_percent << ",";
    json << "\"total_units\": " << pairing.total_units << ",";
    json << "\"covered_units\": " << pairing.covered_units << ",";
    json << "\"stale\": " << pairing.stale << "}";
    pairings.push_back(json.str());
  }
  return "{\"version\": " + std::to_string(status.version) +
         ",\"pairings\": [" + JoinStrings(pairings, ",") + "]}";
}

std::string
JsonReportRenderer::RenderRules(const std::string &title,
                                const std::vector<RuleSummary> &rules) const {
  std::vector<std::string> rendered;
  for (const auto &rule : rules) {
    std::ostringstream json;
    json << "{\"spec\": " << Quote(rule.spec) << ",";
    json << "\"impl\": " << Quote(rule.impl) << ",";
    json << "\"id\": " << Quote(rule.id) << ",";
    json << "\"level\": " << JsonLevel(rule.level) << ",";
    json << "\"text\": " << Quote(rule.text) << ",";
    json << "\"source_file\": " << Quote(rule.source_file) << ",";
    json << "\"source_line\": " << rule.source_line << "}";
    rendered.push_back(json.str());
  }
  return "{\"title\": " + Quote(title) + ",\"rules\": [" +
         JoinStrings(rendered, ",") + "]}";
}

std::string
JsonReportRenderer::RenderStale(const std::vector<StaleReference> &stale) const {
  return "{\"stale\": " + JsonStale(stale) + "}";
}

std::string
JsonReportRenderer::RenderUnmapped(const UnmappedReport &report) const {
  std::vector<std::string> units;
  for (const auto &unit : report.units) {
    units.push_back(JsonUnit(unit));
  }
  return "{\"tree\": " + JsonTree(report.tree) + ",\"units\": [" +
         JoinStrings(units, ",") + "]}";
}

std::string JsonReportRenderer::RenderRuleDetails(
    const std::vector<RuleReport> &rules) const {
  std::vector<std::string> rendered;
  for (const auto &rule : rules) {
    std::vector<std::string> declarations;
    for (const auto &declaration : rule.declarations) {
      std::ostringstream json;
      json << "{\"spec\": " << Quote(declaration.spec) << ",";
      json << "\"text\": " << Quote(declaration.rule.text) << ",";
      json << "\"level\": " << JsonLevel(declaration.rule.level) << ",";
      json << "\"level_explicit\": "
           << (declaration.rule.level_explicit ? "true" : "false") << ",";
      json << "\"status\": " << OptionalQuote(declaration.rule.status) << ",";
      json << "\"fingerprint\": " << Quote(declaration.rule.fingerprint)
           << ",";
      json << "\"source_file\": " << Quote(declaration.rule.source_file)
           << ",";
      json << "\"source_line\": " << declaration.rule.source_line << "}";
      declarations.push_back(json.str());
    }
    std::ostringstream json;
    json << "{\"id\": " << Quote(rule.id) << ",";
    json << "\"declarations\": [" << JoinStrings(declarations, ",") << "],";
    json << "\"impl_refs\": " << JsonReferences(rule.impl_refs) << ",";
    json << "\"verify_refs\": " << JsonReferences(rule.verify_refs) << ",";
    json << "\"depends_refs\": " << JsonReferences(rule.depends_refs) << ",";
    json << "\"related_refs\": " << JsonReferences(rule.related_refs) << ",";
    json << "\"stale\": " << JsonStale(rule.stale) << "}";
    rendered.push_back(json.str());
  }
  return "{\"rules\": [" + JoinStrings(rendered, ",") + "]}";
}

std::string
JsonReportRenderer::RenderFindings(const std::vector<Finding> &findings) const {
  std::vector<std::string> rendered;
  for (const auto &finding : findings) {
    std::vector<std::string> sites;
    for (const auto &site : finding.sites) {
      sites.push_back("{\"file\": " + Quote(site.file) +
                      ",\"line\": " + std::to_string(site.line) + "}");
    }
    std::ostringstream json;
    json << "{\"kind\": " << Quote(FindingKindName(finding.kind)) << ",";
    json << "\"message\": " << Quote(finding.message) << ",";
    json << "\"rule_id\": " << Quote(finding.rule_id) << ",";
    json << "\"spec\": " << Quote(finding.spec) << ",";
    json << "\"impl\": " << Quote(finding.impl) << ",";
    json << "\"sites\": [" << JoinStrings(sites, ",") << "]}";
    rendered.push_back(json.str());
  }
  return "{\"findings\": [" + JoinStrings(rendered, ",") + "]}";
}

std::string
JsonReportRenderer::RenderSearch(const std::vector<SearchHit> &hits) const {
  std::vector<std::string> rendered;
  for (const auto &hit : hits) {
    std::ostringstream json;
    json << "{\"kind\": "
         << Quote(hit.kind == SearchKind::kRule ? "rule" : "unit") << ",";
    json << "\"key\": " << Quote(hit.key) << ",";
    json << "\"spec\": " << Quote(hit.spec) << ",";
    json << "\"file\": " << Quote(hit.file) << ",";
    json << "\"line\": " << hit.line << ",";
    json << "\"snippet\": " << Quote(hit.snippet) << ",";
    json << "\"tier\": " << hit.tier << "}";
    rendered.push_back(json.str());
  }
  return "{\"results\": [" + JoinStrings(rendered, ",") + "]}";
}

std::string
JsonReportRenderer::RenderConfig(const ConfigSummary &summary) const {
  std::vector<std::string> specs;
  for (const auto &spec : summary.config.specs) {
    std::vector<std::string> impls;
    for (const auto &impl : spec.impls) {
      impls.push_back("{\"name\": " + Quote(impl.name) +
                      ",\"include\": " + QuoteList(impl.include) +
                      ",\"exclude\": " + QuoteList(impl.exclude) +
                      ",\"test_include\": " + QuoteList(impl.test_include) +
                      "}");
    }
    specs.push_back("{\"name\": " + Quote(spec.name) +
                    ",\"prefix\": " + Quote(spec.prefix) +
                    ",\"include\": " + QuoteList(spec.include) +
                    ",\"impls\": [" + JoinStrings(impls, ",") + "]}");
  }
  std::vector<std::string> pairings;
  for (const auto &pairing : summary.pairings) {
    pairings.push_back("{\"key\": " + Quote(pairing.Key()) +
                       ",\"files\": " + QuoteList(pairing.files) +
                       ",\"test_files\": " +
                       QuoteList({pairing.test_files.begin(),
                                  pairing.test_files.end()}) +
                       "}");
  }
  return "{\"version\": " + std::to_string(summary.version) +
         ",\"root\": " + Quote(summary.config.root_path) + ",\"specs\": [" +
         JoinStrings(specs, ",") + "],\"pairings\": [" +
         JoinStrings(pairings, ",") + "]}";
}

} // namespace reqtrace
