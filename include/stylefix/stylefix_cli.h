#pragma once

#include <stylefix/interfaces.h>
#include <stylefix/logging.h>

#include <filesystem>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stylefix {

enum class RunMode { kCheck, kFix };

struct RunOptions {
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> config_file;
  std::vector<std::string> include;
  std::vector<std::string> exclude;
  std::vector<std::string> extensions;
  std::vector<std::string> rules;
  std::map<std::string, std::string> options;
  std::map<std::string, std::map<std::string, std::string>> project_options;
  std::optional<bool> changes_are_errors;
  std::optional<LogLevel> log_level;
  bool list_rules = false;
  bool show_help = false;
};

constexpr const char kDefaultConfigFileName[] = ".stylefix.yml";

RunOptions ParseRunArguments(const std::vector<std::string> &arguments);
RunOptions ParseConfigFile(const std::filesystem::path &path);
RunOptions MergeOptions(const RunOptions &config_options,
                        const RunOptions &cli_options);
// Reads --config, or the root's .stylefix.yml when present, and lets the
// command line win over it.
RunOptions ResolveRunOptions(const RunOptions &cli_options);

FormatOptions BuildFormatOptions(const RunOptions &options, RunMode mode,
                                 const std::filesystem::path &root);
LoggingConfig BuildLoggingConfig(const RunOptions &options);

int RunCommand(RunMode mode, const std::vector<std::string> &arguments,
               std::ostream &out);

} // namespace stylefix
