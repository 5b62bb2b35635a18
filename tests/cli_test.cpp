#include <reqtrace/cli.h>
#include <reqtrace/cli_exit_codes.h>
#include <reqtrace/errors.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <sstream>
#include <string>

#include "test_support/temporary_project.h"

namespace reqtrace {
namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;

TEST(ParseQueryArgumentsTest, ParsesCommandFiltersAndFormat) {
  const auto options = ParseQueryArguments(
      {"uncovered", "--spec-impl", "auth/server", "--prefix", "auth.",
       "--root", "/repo", "--json", "--debug"});

  EXPECT_EQ(options.command, "uncovered");
  EXPECT_EQ(options.spec_impl, std::optional<std::string>("auth/server"));
  EXPECT_EQ(options.prefix, std::optional<std::string>("auth."));
  ASSERT_TRUE(options.root.has_value());
  EXPECT_EQ(*options.root, std::filesystem::path("/repo"));
  EXPECT_EQ(options.format, "json");
  EXPECT_EQ(options.log_level, LogLevel::kDebug);
  EXPECT_FALSE(options.show_help);
}

TEST(ParseQueryArgumentsTest, CollectsPositionalsForRuleAndSearch) {
  const auto rule = ParseQueryArguments({"rule", "auth.login", "auth.logout"});
  EXPECT_THAT(rule.positionals,
              ::testing::ElementsAre("auth.login", "auth.logout"));

  const auto search =
      ParseQueryArguments({"search", "pooled", "connection", "--limit", "5"});
  EXPECT_THAT(search.positionals,
              ::testing::ElementsAre("pooled", "connection"));
  EXPECT_EQ(search.limit, std::optional<std::size_t>(5));
}

TEST(ParseQueryArgumentsTest, EmptyArgumentsShowHelp) {
  EXPECT_TRUE(ParseQueryArguments({}).show_help);
  EXPECT_TRUE(ParseQueryArguments({"status", "--help"}).show_help);
}

TEST(ParseQueryArgumentsTest, RejectsInvalidInvocations) {
  EXPECT_THROW(ParseQueryArguments({"report"}), std::invalid_argument);
  EXPECT_THROW(ParseQueryArguments({"rule"}), std::invalid_argument);
  EXPECT_THROW(ParseQueryArguments({"search"}), std::invalid_argument);
  EXPECT_THROW(ParseQueryArguments({"status", "extra"}), std::invalid_argument);
  EXPECT_THROW(ParseQueryArguments({"unmapped", "a", "b"}),
               std::invalid_argument);
  EXPECT_THROW(ParseQueryArguments({"status", "--bogus"}),
               std::invalid_argument);
  EXPECT_THROW(ParseQueryArguments({"status", "--root"}), std::invalid_argument);
  EXPECT_THROW(ParseQueryArguments({"search", "x", "--limit", "0"}),
               std::invalid_argument);
  EXPECT_THROW(ParseQueryArguments({"search", "x", "--limit", "3x"}),
               std::invalid_argument);
  EXPECT_THROW(ParseQueryArguments({"status", "--log-level", "loud"}),
               std::invalid_argument);
}

class RunCommandTest : public ::testing::Test {
protected:
  RunCommandTest() {
    project_.AddFile(".config/reqtrace/config.yaml",
                     "specs:\n"
                     "  - name: auth\n"
                     "    prefix: r\n"
                     "    include: [docs/auth.md]\n"
                     "    impls:\n"
                     "      - name: server\n"
                     "        include: [src/**/*.cpp]\n"
                     "        test_include: [tests/**/*.cpp]\n");
    project_.AddFile("docs/auth.md", "# Auth\n"
                                     "\n"
                                     "r[auth.login]\n"
                                     "Users MUST log in with a password.\n"
                                     "\n"
                                     "r[auth.logout]\n"
                                     "Users SHOULD be able to log out.\n");
    project_.AddFile("src/login.cpp", "// r[impl auth.login]\n"
                                      "bool Login() {\n"
                                      "  return true;\n"
                                      "}\n");
    project_.AddFile("tests/login_test.cpp", "// r[verify auth.login]\n"
                                             "void TestLogin() {\n"
                                             "}\n");
  }

  int Run(std::vector<std::string> arguments) {
    arguments.push_back("--root");
    arguments.push_back(project_.root().string());
    return RunCommand(ParseQueryArguments(arguments), output_);
  }

  test::TemporaryProject project_;
  std::ostringstream output_;
};

TEST_F(RunCommandTest, StatusRendersMarkdown) {
  EXPECT_EQ(Run({"status"}), kExitSuccess);
  EXPECT_THAT(output_.str(), StartsWith("# Coverage Status (version 1)"));
  EXPECT_THAT(output_.str(), HasSubstr("| auth/server | 2 | 1 (50.0%)"));
}

TEST_F(RunCommandTest, UncoveredListsRulesWithoutImplementations) {
  EXPECT_EQ(Run({"uncovered", "--json"}), kExitSuccess);
  EXPECT_THAT(output_.str(), HasSubstr("\"id\": \"auth.logout\""));
  EXPECT_THAT(output_.str(), ::testing::Not(HasSubstr("\"id\": \"auth.login\"")));
  EXPECT_EQ(output_.str().back(), '\n');
}

TEST_F(RunCommandTest, ValidateReturnsFindingsExitCode) {
  EXPECT_EQ(Run({"validate"}), kExitSuccess);

  project_.AddFile("src/broken.cpp", "// r[impl auth.missing]\n"
                                     "void Broken() {\n"
                                     "}\n");
  output_.str("");
  EXPECT_EQ(Run({"validate"}), kExitFindings);
  EXPECT_THAT(output_.str(), HasSubstr("BrokenReference"));
}

TEST_F(RunCommandTest, RuleShowsReferences) {
  EXPECT_EQ(Run({"rule", "auth.login"}), kExitSuccess);
  EXPECT_THAT(output_.str(), HasSubstr("## auth.login"));
  EXPECT_THAT(output_.str(), HasSubstr("- src/login.cpp:1 (auth/server)"));
  EXPECT_THAT(output_.str(), HasSubstr("- tests/login_test.cpp:1 (auth/server)"));
}

TEST_F(RunCommandTest, UnknownRuleIsNotFound) {
  EXPECT_THROW(Run({"rule", "auth.unknown"}), NotFoundError);
  EXPECT_THROW(Run({"uncovered", "--spec-impl", "auth/client"}),
               NotFoundError);
}

TEST_F(RunCommandTest, SearchAndUnmappedUsePositionals) {
  EXPECT_EQ(Run({"search", "password"}), kExitSuccess);
  EXPECT_THAT(output_.str(), HasSubstr("| rule | auth.login |"));

  output_.str("");
  EXPECT_EQ(Run({"unmapped", "src"}), kExitSuccess);
  EXPECT_THAT(output_.str(), HasSubstr("- src/ 1/1 units (100.0%)"));
}

TEST_F(RunCommandTest, MissingConfigIsAConfigError) {
  test::TemporaryProject empty;
  auto options = ParseQueryArguments({"status"});
  options.root = empty.root();
  EXPECT_THROW(RunCommand(options, output_), ConfigError);
}

TEST_F(RunCommandTest, WatchReprintsStatusAfterASourceChange) {
  using namespace std::chrono_literals;
  const auto options =
      ParseQueryArguments({"watch", "--root", project_.root().string()});
  const auto deadline = std::chrono::steady_clock::now() + 10s;
  int polls = 0;
  const auto keep_watching = [&]() {
    if (++polls == 1) {
      project_.AddFile("src/logout.cpp", "// r[impl auth.logout]\n"
                                         "void Logout() {\n"
                                         "}\n");
    }
    return output_.str().find("(version 2)") == std::string::npos &&
           std::chrono::steady_clock::now() < deadline;
  };

  EXPECT_EQ(RunWatch(options, output_, keep_watching, 10ms), kExitSuccess);
  EXPECT_THAT(output_.str(), StartsWith("# Coverage Status (version 1)"));
  EXPECT_THAT(output_.str(), HasSubstr("# Coverage Status (version 2)"));
  EXPECT_THAT(output_.str(), HasSubstr("| auth/server | 2 | 2 (100.0%)"));
}

TEST_F(RunCommandTest, HelpPrintsUsage) {
  EXPECT_EQ(RunCommand(ParseQueryArguments({"--help"}), output_), kExitSuccess);
  EXPECT_THAT(output_.str(), StartsWith("Usage: reqtrace"));
}

} // namespace
} // namespace reqtrace
