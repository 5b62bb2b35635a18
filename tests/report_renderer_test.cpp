#include <reqtrace/report_renderer.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace reqtrace {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

StatusReport SampleStatus() {
  PairingStatus pairing;
  pairing.spec = "auth";
  pairing.impl = "server";
  pairing.total_rules = 3;
  pairing.impl_covered = 2;
  pairing.verify_covered = 1;
  pairing.impl_percent = 200.0 / 3.0;
  pairing.verify_percent = 100.0 / 3.0;
  pairing.total_units = 10;
  pairing.covered_units = 4;
  pairing.stale = 1;
  return {7, {pairing}};
}

RuleSummary SampleRule() {
  RuleSummary rule;
  rule.spec = "auth";
  rule.impl = "server";
  rule.id = "auth.login";
  rule.level = Level::kMust;
  rule.text = "Users MUST log in | out";
  rule.source_file = "docs/auth.md";
  rule.source_line = 12;
  return rule;
}

StaleReference SampleStale() {
  Reference reference;
  reference.verb = Verb::kImpl;
  reference.prefix = "r";
  reference.rule_id = "auth.login";
  reference.file = "src/login.cpp";
  reference.line = 4;
  reference.spec = "auth";
  reference.impl = "server";
  reference.captured_fingerprint = "deadbeef";
  return {reference, "0123456789abcdef"};
}

TEST(MarkdownReportRendererTest, RendersStatusTable) {
  const auto output = MarkdownReportRenderer().RenderStatus(SampleStatus());

  EXPECT_THAT(output, StartsWith("# Coverage Status (version 7)"));
  EXPECT_THAT(output,
              HasSubstr("| auth/server | 3 | 2 (66.7%) | 1 (33.3%) | 4/10 | 1 |"));
}

TEST(MarkdownReportRendererTest, EmptyTablesSayNone) {
  const MarkdownReportRenderer renderer;

  EXPECT_THAT(renderer.RenderStatus({}), HasSubstr("| None |"));
  EXPECT_THAT(renderer.RenderRules("Uncovered Rules", {}), HasSubstr("| None |"));
  EXPECT_THAT(renderer.RenderStale({}), HasSubstr("| None |"));
  EXPECT_THAT(renderer.RenderFindings({}), HasSubstr("| None |"));
  EXPECT_THAT(renderer.RenderSearch({}), HasSubstr("| None |"));
}

TEST(MarkdownReportRendererTest, EscapesPipesInRuleText) {
  const auto output =
      MarkdownReportRenderer().RenderRules("Uncovered Rules", {SampleRule()});

  EXPECT_THAT(output, StartsWith("## Uncovered Rules"));
  EXPECT_THAT(output, HasSubstr("| auth/server | auth.login | must | "
                                "Users MUST log in \\| out | docs/auth.md:12 |"));
}

TEST(MarkdownReportRendererTest, RendersStaleFingerprints) {
  const auto output = MarkdownReportRenderer().RenderStale({SampleStale()});

  EXPECT_THAT(output, HasSubstr("| auth/server | auth.login | src/login.cpp:4 | "
                                "deadbeef | 0123456789abcdef |"));
}

TEST(MarkdownReportRendererTest, RendersCoverageTreeAndUnits) {
  UnmappedReport report;
  report.tree.name = ".";
  report.tree.total_units = 2;
  report.tree.covered_units = 1;
  CoverageNode file;
  file.name = "main.cpp";
  file.path = "main.cpp";
  file.is_file = true;
  file.total_units = 2;
  file.covered_units = 1;
  report.tree.children.push_back(file);
  report.units.push_back(
      {"main.cpp", 5, 9, UnitKind::kFunction, std::string("Run"), {}});

  const auto output = MarkdownReportRenderer().RenderUnmapped(report);

  EXPECT_THAT(output, HasSubstr("- ./ 1/2 units (50.0%)"));
  EXPECT_THAT(output, HasSubstr("  - main.cpp 1/2 units (50.0%)"));
  EXPECT_THAT(output, HasSubstr("| main.cpp:5-9 | function | Run |"));
}

TEST(MarkdownReportRendererTest, RendersRuleDetailSections) {
  RuleReport report;
  report.id = "auth.login";
  Rule rule;
  rule.id = "auth.login";
  rule.text = "Users MUST log in.";
  rule.level = Level::kMust;
  rule.status = "draft";
  rule.fingerprint = "0123456789abcdef";
  rule.source_file = "docs/auth.md";
  rule.source_line = 3;
  report.declarations.push_back({"auth", rule});
  report.impl_refs.push_back(SampleStale().reference);
  report.stale.push_back(SampleStale());

  const auto output = MarkdownReportRenderer().RenderRuleDetails({report});

  EXPECT_THAT(output, HasSubstr("## auth.login"));
  EXPECT_THAT(output, HasSubstr("- Defined at: docs/auth.md:3"));
  EXPECT_THAT(output, HasSubstr("- Status: draft"));
  EXPECT_THAT(output, HasSubstr("- src/login.cpp:4 (auth/server) @deadbeef"));
  EXPECT_THAT(output, HasSubstr("### Verifications\n\n- None"));
  EXPECT_THAT(output, HasSubstr("### Stale"));
}

TEST(MarkdownReportRendererTest, RendersFindingSites) {
  Finding finding;
  finding.kind = FindingKind::kDuplicateRuleId;
  finding.rule_id = "auth.login";
  finding.spec = "auth";
  finding.message = "rule declared twice";
  finding.sites = {{"docs/a.md", 1}, {"docs/b.md", 2}};

  const auto output = MarkdownReportRenderer().RenderFindings({finding});

  EXPECT_THAT(output, HasSubstr("| DuplicateRuleId | auth | auth.login | "
                                "docs/a.md:1<br>docs/b.md:2 |"));
}

TEST(MarkdownReportRendererTest, ConfigListsActivePairings) {
  ConfigSummary summary;
  summary.version = 2;
  summary.config.root_path = "/repo";
  SpecConfig spec;
  spec.name = "auth";
  spec.prefix = "r";
  spec.include = {"docs/auth.md"};
  spec.impls.push_back({"server", {"src/**/*.cpp"}, {}, {"tests/**"}});
  summary.config.specs.push_back(spec);
  summary.pairings.push_back(
      {"auth", "server", {"src/a.cpp", "tests/a.cpp"}, {"tests/a.cpp"}});

  const auto output = MarkdownReportRenderer().RenderConfig(summary);

  EXPECT_THAT(output, StartsWith("# Configuration (version 2)"));
  EXPECT_THAT(output, HasSubstr("## auth (prefix `r`)"));
  EXPECT_THAT(output, HasSubstr("  - test_include: tests/**"));
  EXPECT_THAT(output, Not(HasSubstr("exclude:")));
  EXPECT_THAT(output, HasSubstr("- auth/server: 2 files (1 test)"));
}

TEST(JsonReportRendererTest, StatusCarriesVersionAndPairings) {
  const auto output = JsonReportRenderer().RenderStatus(SampleStatus());

  EXPECT_THAT(output, StartsWith("{\"version\": 7,\"pairings\": [{"));
  EXPECT_THAT(output, HasSubstr("\"spec\": \"auth\""));
  EXPECT_THAT(output, HasSubstr("\"total_rules\": 3"));
  EXPECT_THAT(output, HasSubstr("\"stale\": 1}"));
}

TEST(JsonReportRendererTest, EscapesStringsAndRendersNullLevels) {
  auto rule = SampleRule();
  rule.text = "say \"hi\"\n";
  rule.level.reset();

  const auto output = JsonReportRenderer().RenderRules("Untested Rules", {rule});

  EXPECT_THAT(output, StartsWith("{\"title\": \"Untested Rules\",\"rules\": ["));
  EXPECT_THAT(output, HasSubstr("\"text\": \"say \\\"hi\\\"\\n\""));
  EXPECT_THAT(output, HasSubstr("\"level\": null"));
}

TEST(JsonReportRendererTest, EmptyCollectionsRenderAsEmptyArrays) {
  const JsonReportRenderer renderer;

  EXPECT_EQ(renderer.RenderStale({}), "{\"stale\": []}");
  EXPECT_EQ(renderer.RenderFindings({}), "{\"findings\": []}");
  EXPECT_EQ(renderer.RenderSearch({}), "{\"results\": []}");
  EXPECT_EQ(renderer.RenderRuleDetails({}), "{\"rules\": []}");
}

TEST(JsonReportRendererTest, StaleReferencesIncludeCapturedFingerprint) {
  const auto output = JsonReportRenderer().RenderStale({SampleStale()});

  EXPECT_THAT(output, HasSubstr("\"captured_fingerprint\": \"deadbeef\""));
  EXPECT_THAT(output, HasSubstr("\"current_fingerprint\": \"0123456789abcdef\""));
  EXPECT_THAT(output, HasSubstr("\"verb\": \"impl\""));
}

TEST(JsonReportRendererTest, SearchHitsCarryTier) {
  SearchHit hit;
  hit.kind = SearchKind::kUnit;
  hit.key = "src/a.cpp:1-3";
  hit.file = "src/a.cpp";
  hit.line = 1;
  hit.snippet = "Run";
  hit.tier = 2;

  const auto output = JsonReportRenderer().RenderSearch({hit});

  EXPECT_THAT(output, HasSubstr("\"kind\": \"unit\""));
  EXPECT_THAT(output, HasSubstr("\"key\": \"src/a.cpp:1-3\""));
  EXPECT_THAT(output, HasSubstr("\"tier\": 2}"));
}

} // namespace
} // namespace reqtrace
