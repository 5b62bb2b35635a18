#include <reqtrace/errors.h>
#include <reqtrace/glob.h>

#include <gtest/gtest.h>

namespace reqtrace {
namespace {

TEST(GlobTest, SingleStarStaysWithinOneSegment) {
  const GlobPattern pattern("src/*.cpp");
  EXPECT_TRUE(pattern.Matches("src/main.cpp"));
  EXPECT_FALSE(pattern.Matches("src/net/socket.cpp"));
  EXPECT_FALSE(pattern.Matches("main.cpp"));
}

TEST(GlobTest, DoubleStarSpansDirectories) {
  const GlobPattern pattern("src/**/*.cpp");
  EXPECT_TRUE(pattern.Matches("src/main.cpp"));
  EXPECT_TRUE(pattern.Matches("src/net/tcp/socket.cpp"));
  EXPECT_FALSE(pattern.Matches("tests/main.cpp"));

  const GlobPattern anything("**");
  EXPECT_TRUE(anything.Matches("a/b/c.txt"));
}

TEST(GlobTest, MatchesAgainstTheWholeRelativePath) {
  const GlobPattern pattern("*.src");
  EXPECT_TRUE(pattern.Matches("db.src"));
  EXPECT_FALSE(pattern.Matches("lib/db.src"));
}

TEST(GlobTest, SupportsClassesAlternativesAndSingleCharacters) {
  EXPECT_TRUE(GlobPattern("file?.txt").Matches("file1.txt"));
  EXPECT_FALSE(GlobPattern("file?.txt").Matches("file12.txt"));
  EXPECT_TRUE(GlobPattern("[ab].md").Matches("a.md"));
  EXPECT_FALSE(GlobPattern("[!ab].md").Matches("a.md"));
  EXPECT_TRUE(GlobPattern("src/*.{h,cpp}").Matches("src/x.h"));
  EXPECT_TRUE(GlobPattern("src/*.{h,cpp}").Matches("src/x.cpp"));
  EXPECT_FALSE(GlobPattern("src/*.{h,cpp}").Matches("src/x.hpp"));
}

TEST(GlobTest, TreatsRegexCharactersLiterally) {
  EXPECT_TRUE(GlobPattern("docs/a+b.md").Matches("docs/a+b.md"));
  EXPECT_FALSE(GlobPattern("docs/a.md").Matches("docs/aXmd"));
}

TEST(GlobTest, RejectsEmptyAndUnterminatedPatterns) {
  EXPECT_THROW(GlobPattern(""), ConfigError);
  EXPECT_THROW(GlobPattern("src/[ab"), ConfigError);
  EXPECT_THROW(GlobPattern("src/{a,b"), ConfigError);
}

} // namespace
} // namespace reqtrace
