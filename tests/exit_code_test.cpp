#include <reqtrace/cli_exit_codes.h>
#include <reqtrace/models.h>

#include <gtest/gtest.h>

namespace reqtrace {
namespace {

TEST(FindingsExitCodesTest, ReturnsZeroWhenThereAreNoFindings) {
  EXPECT_EQ(FindingsExitCode({}), kExitSuccess);
}

TEST(FindingsExitCodesTest, ReturnsFindingsCodeWhenFindingsExist) {
  Finding finding;
  finding.kind = FindingKind::kBrokenReference;
  EXPECT_EQ(FindingsExitCode({finding}), 2);
}

TEST(FindingsExitCodesTest, NotFoundIsDistinctFromOtherFailures) {
  EXPECT_NE(kExitNotFound, kExitError);
  EXPECT_NE(kExitNotFound, kExitFindings);
  EXPECT_EQ(kExitNotFound, 3);
}

} // namespace
} // namespace reqtrace
