#include <stylefix/cli_exit_codes.h>
#include <stylefix/stylefix_cli.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>
#include <sys/wait.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace stylefix {
namespace {

using ::testing::HasSubstr;

std::filesystem::path ExecutableUnderTest() {
  return std::filesystem::current_path() / "stylefix";
}

int ExitCode(const std::string &command) {
  return WEXITSTATUS(std::system(command.c_str()));
}

TEST(CliIntegrationTest, CheckReportsTabIndentationAsWarning) {
  test::TemporaryProject project;
  project.AddFile("src/example.cpp", "int Example() {\n\treturn 42;\n}\n");
  const auto log_path = project.root() / "stylefix.log";

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;

  const std::string command = cli.string() + " check --root " +
                              project.root().string() + " 2> " +
                              log_path.string();

  ASSERT_EQ(ExitCode(command), kExitClean);
  EXPECT_THAT(project.ReadFile("stylefix.log"),
              HasSubstr("src/example.cpp(2,1): Replace tab indentation with "
                        "spaces."));
  EXPECT_EQ("int Example() {\n\treturn 42;\n}\n",
            project.ReadFile("src/example.cpp"));
}

TEST(CliIntegrationTest, ErrorSeverityFailsTheCheck) {
  test::TemporaryProject project;
  project.AddFile("src/example.cpp", "int Example() { return 42; }   \n");

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;

  const std::string command = cli.string() + " --root " +
                              project.root().string() +
                              " --severity error 2> /dev/null";

  ASSERT_EQ(ExitCode(command), kExitDiagnosticErrors);
}

TEST(CliIntegrationTest, FixRewritesFilesAndLeavesThemClean) {
  test::TemporaryProject project;
  project.AddFile("src/a.cpp", "int a() {\n\treturn 1; \n}");
  project.AddFile("src/b.h", "int b();\n");
  project.AddFile("build/generated.cpp", "\tint g;\n");

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;

  const std::string fix_command = cli.string() + " fix --root " +
                                  project.root().string() +
                                  " --exclude build";
  ASSERT_EQ(ExitCode(fix_command), kExitClean);

  EXPECT_EQ("int a() {\n return 1;\n}\n", project.ReadFile("src/a.cpp"));
  EXPECT_EQ("int b();\n", project.ReadFile("src/b.h"));
  EXPECT_EQ("\tint g;\n", project.ReadFile("build/generated.cpp"));

  const std::string check_command = cli.string() + " check --root " +
                                    project.root().string() +
                                    " --exclude build --severity error";
  EXPECT_EQ(ExitCode(check_command), kExitClean);
}

TEST(CliIntegrationTest, UsesConfigFileFromRoot) {
  test::TemporaryProject project;
  project.AddFile("src/a.cpp", "\tint a;   \n");
  project.AddFile(kDefaultConfigFileName, "rules: [trailing-whitespace]\n"
                                          "options:\n"
                                          "  max_line_length: 80\n");

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;

  const std::string command =
      cli.string() + " fix --root " + project.root().string();
  ASSERT_EQ(ExitCode(command), kExitClean);

  EXPECT_EQ("\tint a;\n", project.ReadFile("src/a.cpp"));
}

TEST(CliIntegrationTest, UnknownRuleIsAConfigurationFailure) {
  test::TemporaryProject project;
  project.AddFile("src/a.cpp", "int a;\n");

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;

  const std::string command = cli.string() + " check --root " +
                              project.root().string() +
                              " --rules no-such-rule > /dev/null 2>&1";
  EXPECT_EQ(ExitCode(command), kExitFailure);
}

TEST(CliIntegrationTest, ListsRegisteredRules) {
  std::stringstream out;

  EXPECT_EQ(kExitClean, RunCommand(RunMode::kCheck, {"--list-rules"}, out));

  EXPECT_THAT(out.str(), HasSubstr("tab-indentation (fixable)\n"));
  EXPECT_THAT(out.str(), HasSubstr("line-length\n"));
}

TEST(CliIntegrationTest, FixReportsHowManyFilesChanged) {
  test::TemporaryProject project;
  project.AddFile("a.cpp", "int a;");
  project.AddFile("b.cpp", "int b;\n");
  std::stringstream out;

  const auto exit_code = RunCommand(
      RunMode::kFix, {"--root", project.root().string(), "--log-level", "error"},
      out);

  EXPECT_EQ(kExitClean, exit_code);
  EXPECT_EQ("Formatted 1 of 2 files.\n", out.str());
  EXPECT_EQ("int a;\n", project.ReadFile("a.cpp"));
}

} // namespace
} // namespace stylefix
