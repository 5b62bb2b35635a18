#include <reqtrace/spec_parser.h>
#include <reqtrace/staleness.h>

#include <gtest/gtest.h>

namespace reqtrace {
namespace {

TEST(SpecParserTest, ParsesMarkersAtDocumentStartAndAfterBlankLines) {
  const std::string document = "r[db.conn]\n"
                               "MUST establish a pooled connection.\n"
                               "\n"
                               "r[db.retry]\n"
                               "Retries SHOULD back off.\n";
  const auto rules = SpecParser("r").Parse("spec/db.md", document);

  ASSERT_EQ(rules.size(), 2u);
  EXPECT_EQ(rules[0].id, "db.conn");
  EXPECT_EQ(rules[0].text, "MUST establish a pooled connection.");
  EXPECT_EQ(rules[0].level, Level::kMust);
  EXPECT_EQ(rules[0].source_file, "spec/db.md");
  EXPECT_EQ(rules[0].source_line, 1u);
  EXPECT_EQ(rules[1].id, "db.retry");
  EXPECT_EQ(rules[1].level, Level::kShould);
  EXPECT_EQ(rules[1].source_line, 4u);
}

TEST(SpecParserTest, ByteOrderMarkDoesNotHideTheFirstMarker) {
  const std::string document = "\xEF\xBB\xBFr[db.conn]\n"
                               "MUST connect.\n";
  const auto rules = SpecParser("r").Parse("spec/db.md", document);

  ASSERT_EQ(rules.size(), 1u);
  EXPECT_EQ(rules[0].id, "db.conn");
  EXPECT_EQ(rules[0].source_line, 1u);
  EXPECT_EQ(rules[0].text, "MUST connect.");
}

TEST(SpecParserTest, IgnoresMarkersInsideParagraphs) {
  const std::string document = "Intro text mentions\n"
                               "r[not.a.rule] in the middle of prose.\n";
  EXPECT_TRUE(SpecParser("r").Parse("spec.md", document).empty());
}

TEST(SpecParserTest, HeadingsEndRuleText) {
  const std::string document = "# Auth\n"
                               "\n"
                               "r[auth.login]\n"
                               "Users MUST authenticate.\n"
                               "\n"
                               "More detail on the same rule.\n"
                               "## Next section\n"
                               "Unrelated prose.\n";
  const auto rules = SpecParser("r").Parse("auth.md", document);

  ASSERT_EQ(rules.size(), 1u);
  EXPECT_EQ(rules[0].text,
            "Users MUST authenticate.\n\nMore detail on the same rule.");
  EXPECT_EQ(rules[0].source_line, 3u);
}

TEST(SpecParserTest, MarkersInsideCodeFencesAreNotRules) {
  const std::string document = "r[outer]\n"
                               "Example:\n"
                               "```\n"
                               "\n"
                               "r[inner]\n"
                               "```\n";
  const auto rules = SpecParser("r").Parse("spec.md", document);

  ASSERT_EQ(rules.size(), 1u);
  EXPECT_EQ(rules[0].id, "outer");
  EXPECT_NE(rules[0].text.find("r[inner]"), std::string::npos);
}

TEST(SpecParserTest, ExplicitLevelAndStatusOverrideInference) {
  const std::string document =
      "r[api.v2 level=may status=draft] Clients MUST send a version.\n";
  const auto rules = SpecParser("r").Parse("spec.md", document);

  ASSERT_EQ(rules.size(), 1u);
  EXPECT_EQ(rules[0].level, Level::kMay);
  EXPECT_TRUE(rules[0].level_explicit);
  EXPECT_EQ(rules[0].status, std::optional<std::string>("draft"));
  EXPECT_EQ(rules[0].text, "Clients MUST send a version.");
}

TEST(SpecParserTest, BareMarkersHaveEmptyTextAndNoLevel) {
  const auto rules = SpecParser("r").Parse("spec.md", "r[bare]\n\nr[next]\n");

  ASSERT_EQ(rules.size(), 2u);
  EXPECT_EQ(rules[0].text, "");
  EXPECT_FALSE(rules[0].level.has_value());
  EXPECT_EQ(rules[0].fingerprint, Fingerprint(""));
}

TEST(SpecParserTest, RecordsEveryDuplicateDeclaration) {
  const auto rules =
      SpecParser("r").Parse("spec.md", "r[dup]\nOne.\n\nr[dup]\nTwo.\n");

  ASSERT_EQ(rules.size(), 2u);
  EXPECT_EQ(rules[0].id, "dup");
  EXPECT_EQ(rules[1].id, "dup");
  EXPECT_NE(rules[0].fingerprint, rules[1].fingerprint);
}

TEST(SpecParserTest, OnlyTheConfiguredPrefixDeclaresRules) {
  const auto rules =
      SpecParser("api").Parse("spec.md", "r[x]\nOne.\n\napi[y]\nTwo.\n");

  ASSERT_EQ(rules.size(), 1u);
  EXPECT_EQ(rules[0].id, "y");
}

TEST(LevelInferenceTest, FirstTierWithAKeywordWins) {
  EXPECT_EQ(InferLevel("You MAY retry but MUST log."), Level::kMust);
  EXPECT_EQ(InferLevel("It is NOT RECOMMENDED to cache."), Level::kShould);
  EXPECT_EQ(InferLevel("the field is optional"), Level::kMay);
  EXPECT_EQ(InferLevel("shall not overflow"), Level::kMust);
  EXPECT_FALSE(InferLevel("Describes the format.").has_value());
  EXPECT_FALSE(InferLevel("mustard is not a keyword").has_value());
}

TEST(LevelInferenceTest, InferenceIsIdempotent) {
  const std::string text = "Servers SHOULD close idle sockets.";
  const auto first = InferLevel(text);
  EXPECT_EQ(first, InferLevel(text));
  EXPECT_EQ(first, Level::kShould);
}

} // namespace
} // namespace reqtrace
