#include <reqtrace/comment_styles.h>
#include <reqtrace/errors.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace reqtrace {
namespace {

using ::testing::ElementsAre;

TEST(CommentStyleTableTest, MapsExtensionsToFamilies) {
  const CommentStyleTable table;
  EXPECT_EQ(table.ForPath("src/main.cpp").family, "c");
  EXPECT_EQ(table.ForPath("tool/run.PY").family, "hash");
  EXPECT_EQ(table.ForPath("db/schema.sql").family, "dash");
  EXPECT_EQ(table.ForPath("scripts/build.sh").family, "shell");
  EXPECT_EQ(table.ForPath("docs/page.html").family, "markup");
  EXPECT_EQ(table.ForPath("web/app.tsx").family, "script");
  EXPECT_EQ(table.ForPath("lib/main.dart").family, "script");
  EXPECT_EQ(table.ForPath("src/lib.rs").family, "c");
}

TEST(CommentStyleTableTest, UnknownExtensionsFallBackToC) {
  const CommentStyleTable table;
  EXPECT_EQ(table.ForPath("db.src").family, "c");
  EXPECT_EQ(table.ForPath("Makefile").family, "c");
}

TEST(CommentStyleTableTest, OverridesAcceptExtensionsWithOrWithoutDot) {
  const CommentStyleTable table(
      std::map<std::string, std::string>{{"src", "dash"}, {".CPP", "hash"}});
  EXPECT_EQ(table.ForPath("db.src").family, "dash");
  EXPECT_EQ(table.ForPath("main.cpp").family, "hash");
}

TEST(CommentStyleTableTest, RejectsUnknownFamilies) {
  EXPECT_THROW(CommentFamily("fortran"), ConfigError);
  CommentStyleTable table;
  EXPECT_THROW(table.Assign(".f90", "fortran"), ConfigError);
  EXPECT_THAT(CommentFamilyNames(), ::testing::Contains("semicolon"));
}

TEST(LexSourceTest, SplitsCodeFromLineComments) {
  const auto source = LexSource("a.c", "int x = 1; // r[impl a.b]\n",
                                CommentFamily("c"));

  ASSERT_EQ(source.lines.size(), 1u);
  EXPECT_EQ(source.lines[0].code, "int x = 1; ");
  EXPECT_THAT(source.lines[0].comments, ElementsAre(" r[impl a.b]"));
  EXPECT_FALSE(source.lines[0].IsCommentOnly());
}

TEST(LexSourceTest, CommentMarkersInsideStringsAreCode) {
  const auto source =
      LexSource("a.c", "const char *url = \"http://x\"; // note\n",
                CommentFamily("c"));

  ASSERT_EQ(source.lines.size(), 1u);
  EXPECT_EQ(source.lines[0].code, "const char *url = \"\"; ");
  EXPECT_THAT(source.lines[0].comments, ElementsAre(" note"));
}

TEST(LexSourceTest, ScriptSingleQuotesOpenStrings) {
  const auto source = LexSource("a.js", "const s = 'a // b {';\n",
                                CommentFamily("script"));

  ASSERT_EQ(source.lines.size(), 1u);
  EXPECT_EQ(source.lines[0].code, "const s = '';");
  EXPECT_TRUE(source.lines[0].comments.empty());
}

TEST(LexSourceTest, CharLiteralsDoNotOpenStrings) {
  const auto source =
      LexSource("a.c", "char q = '\"'; // quote\n", CommentFamily("c"));

  ASSERT_EQ(source.lines.size(), 1u);
  EXPECT_EQ(source.lines[0].code, "char q = ''; ");
  EXPECT_THAT(source.lines[0].comments, ElementsAre(" quote"));
}

TEST(LexSourceTest, BlockCommentsSpanLines) {
  const auto source = LexSource(
      "a.c", "/* first\n * r[impl a.b]\n */ int y;\n", CommentFamily("c"));

  ASSERT_EQ(source.lines.size(), 3u);
  EXPECT_THAT(source.lines[0].comments, ElementsAre(" first"));
  EXPECT_TRUE(source.lines[0].IsCommentOnly());
  EXPECT_THAT(source.lines[1].comments, ElementsAre(" * r[impl a.b]"));
  EXPECT_THAT(source.lines[2].comments, ElementsAre(" "));
  EXPECT_EQ(source.lines[2].code, " int y;");
}

TEST(LexSourceTest, MarkupCommentsAndIndentation) {
  const auto source = LexSource(
      "page.html", "<!-- r[impl ui.nav] -->\n\t<nav>\n", CommentFamily("markup"));

  ASSERT_EQ(source.lines.size(), 2u);
  EXPECT_THAT(source.lines[0].comments, ElementsAre(" r[impl ui.nav] "));
  EXPECT_EQ(source.lines[1].indent, 4u);
  EXPECT_TRUE(source.lines[1].HasCode());
}

TEST(LexSourceTest, HashFamilyTreatsSingleQuotesAsStrings) {
  const auto source =
      LexSource("a.py", "x = '#not a comment'  # real\n", CommentFamily("hash"));

  ASSERT_EQ(source.lines.size(), 1u);
  EXPECT_EQ(source.lines[0].code, "x = ''  ");
  EXPECT_THAT(source.lines[0].comments, ElementsAre(" real"));
}

TEST(LexSourceTest, KeepsBlankLinesAndStripsCarriageReturns) {
  const auto source = LexSource("a.c", "a;\r\n\r\nb;", CommentFamily("c"));

  ASSERT_EQ(source.lines.size(), 3u);
  EXPECT_TRUE(source.lines[1].IsBlank());
  EXPECT_EQ(source.lines[2].raw, "b;");
}

} // namespace
} // namespace reqtrace
