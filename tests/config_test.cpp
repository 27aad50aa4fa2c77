#include <stylefix/stylefix_cli.h>

#include "test_support/temporary_project.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

namespace stylefix {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Pair;
using ::testing::UnorderedElementsAre;

TEST(RunArgumentsTest, ParsesListsAndFlags) {
  const auto options = ParseRunArguments(
      {"--root", "/w", "--include", "src/a.cpp, src/b.cpp", "--include",
       "src/a.cpp", "--exclude", "build", "--rules",
       "tab-indentation,final-newline", "--option", "max_line_length = 80",
       "--severity", "error", "--debug"});

  ASSERT_TRUE(options.root.has_value());
  EXPECT_EQ("/w", options.root->string());
  EXPECT_THAT(options.include, ElementsAre("src/a.cpp", "src/b.cpp"));
  EXPECT_THAT(options.exclude, ElementsAre("build"));
  EXPECT_THAT(options.rules, ElementsAre("tab-indentation", "final-newline"));
  EXPECT_THAT(options.options, ElementsAre(Pair("max_line_length", "80")));
  EXPECT_EQ(std::optional<bool>(true), options.changes_are_errors);
  EXPECT_EQ(std::optional<LogLevel>(LogLevel::kDebug), options.log_level);
}

TEST(RunArgumentsTest, RejectsMalformedInput) {
  EXPECT_THROW(ParseRunArguments({"--root"}), std::invalid_argument);
  EXPECT_THROW(ParseRunArguments({"--frobnicate"}), std::invalid_argument);
  EXPECT_THROW(ParseRunArguments({"--severity", "fatal"}),
               std::invalid_argument);
  EXPECT_THROW(ParseRunArguments({"--option", "novalue"}),
               std::invalid_argument);
  EXPECT_THROW(ParseRunArguments({"--log-level", "loud"}),
               std::invalid_argument);
}

TEST(RunArgumentsTest, HelpStopsParsing) {
  const auto options = ParseRunArguments({"--help", "--frobnicate"});
  EXPECT_TRUE(options.show_help);
}

TEST(ConfigFileTest, ReadsEverySupportedKey) {
  test::TemporaryProject project;
  const auto config = project.AddFile(".stylefix.yml", R"(root: src
include: [a.cpp, b.cpp]
ignored-paths:
  - generated
extensions: [".cpp", "h"]
rules: trailing-whitespace
options:
  max_line_length: 100
  insert_final_newline: false
projects:
  cpp:
    indent_style: tab
severity: warning
log-level: trace
)");

  const auto options = ParseConfigFile(config);

  EXPECT_EQ(project.root() / "src", *options.root);
  EXPECT_THAT(options.include, ElementsAre("a.cpp", "b.cpp"));
  EXPECT_THAT(options.exclude, ElementsAre("generated"));
  EXPECT_THAT(options.extensions, ElementsAre(".cpp", "h"));
  EXPECT_THAT(options.rules, ElementsAre("trailing-whitespace"));
  EXPECT_THAT(options.options,
              UnorderedElementsAre(Pair("max_line_length", "100"),
                                   Pair("insert_final_newline", "false")));
  EXPECT_THAT(options.project_options,
              ElementsAre(Pair("cpp", ElementsAre(Pair("indent_style", "tab")))));
  EXPECT_EQ(std::optional<bool>(false), options.changes_are_errors);
  EXPECT_EQ(std::optional<LogLevel>(LogLevel::kTrace), options.log_level);
}

TEST(ConfigFileTest, UnknownKeysListSupportedOnes) {
  test::TemporaryProject project;
  const auto config = project.AddFile("bad.yml", "colour: blue\n");

  try {
    ParseConfigFile(config);
    FAIL() << "expected invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_THAT(error.what(), HasSubstr("Unknown config key: colour"));
    EXPECT_THAT(error.what(), HasSubstr("root, include, exclude"));
  }
}

TEST(ConfigFileTest, RejectsWrongShapesAndFormats) {
  test::TemporaryProject project;
  EXPECT_THROW(ParseConfigFile(project.AddFile("list.yml", "- a\n- b\n")),
               std::invalid_argument);
  EXPECT_THROW(
      ParseConfigFile(project.AddFile("options.yml", "options: [a, b]\n")),
      std::invalid_argument);
  EXPECT_THROW(ParseConfigFile(project.AddFile("config.json", "{}")),
               std::invalid_argument);
  EXPECT_THROW(ParseConfigFile(project.root() / "missing.yml"),
               std::runtime_error);
}

TEST(MergeOptionsTest, CommandLineWinsOverConfig) {
  RunOptions config;
  config.root = "/from-config";
  config.rules = {"line-length"};
  config.exclude = {"generated"};
  config.options = {{"max_line_length", "100"}, {"indent_style", "tab"}};
  config.project_options = {{"c", {{"max_line_length", "80"}}}};
  config.changes_are_errors = true;

  RunOptions cli;
  cli.root = "/from-cli";
  cli.options = {{"max_line_length", "90"}};
  cli.project_options = {{"c", {{"indent_style", "space"}}}};

  const auto merged = MergeOptions(config, cli);

  EXPECT_EQ("/from-cli", merged.root->string());
  EXPECT_THAT(merged.rules, ElementsAre("line-length"));
  EXPECT_THAT(merged.exclude, ElementsAre("generated"));
  EXPECT_THAT(merged.options,
              UnorderedElementsAre(Pair("max_line_length", "90"),
                                   Pair("indent_style", "tab")));
  EXPECT_THAT(merged.project_options.at("c"),
              UnorderedElementsAre(Pair("max_line_length", "80"),
                                   Pair("indent_style", "space")));
  EXPECT_EQ(std::optional<bool>(true), merged.changes_are_errors);
}

TEST(ResolveRunOptionsTest, DiscoversConfigInRoot) {
  test::TemporaryProject project;
  project.AddFile(kDefaultConfigFileName, "rules: [final-newline]\n");

  RunOptions cli;
  cli.root = project.root();
  const auto resolved = ResolveRunOptions(cli);

  EXPECT_THAT(resolved.rules, ElementsAre("final-newline"));
  ASSERT_TRUE(resolved.config_file.has_value());
  EXPECT_EQ(project.root() / kDefaultConfigFileName, *resolved.config_file);
}

TEST(ResolveRunOptionsTest, RequiresRootUnlessListingRules) {
  EXPECT_THROW(ResolveRunOptions(RunOptions{}), std::invalid_argument);

  RunOptions list;
  list.list_rules = true;
  EXPECT_NO_THROW(ResolveRunOptions(list));
}

TEST(BuildOptionsTest, MapsModeSeverityAndLogLevel) {
  RunOptions options;
  options.changes_are_errors = true;

  const auto check = BuildFormatOptions(options, RunMode::kCheck, "/w");
  EXPECT_EQ("/w", check.workspace_folder);
  EXPECT_FALSE(check.save_formatted_files);
  EXPECT_TRUE(check.changes_are_errors);
  EXPECT_TRUE(BuildFormatOptions(options, RunMode::kFix, "/w")
                  .save_formatted_files);

  EXPECT_EQ(LogLevel::kWarn, BuildLoggingConfig(options).level);
  options.log_level = LogLevel::kInfo;
  EXPECT_EQ(LogLevel::kInfo, BuildLoggingConfig(options).level);
}

} // namespace
} // namespace stylefix
