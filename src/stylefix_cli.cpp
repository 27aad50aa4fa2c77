#include <stylefix/stylefix_cli.h>

#include <stylefix/analysis_orchestrator_builder.h>
#include <stylefix/analyzer_registry.h>
#include <stylefix/cli_exit_codes.h>
#include <stylefix/folder_workspace_loader.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {

using stylefix::RunOptions;

void PrintUsage(std::ostream &out) {
  out << "Usage: stylefix [check|fix] --root <path> [options]\n"
      << "Commands:\n"
      << "  check   Report style diagnostics (default).\n"
      << "  fix     Apply automatic fixes and save the changed files.\n"
      << "Options:\n"
      << "  --root <path>          Workspace folder to analyze\n"
      << "  --include <list>       Comma-separated files (relative to --root)\n"
      << "                         to restrict analysis to\n"
      << "  --exclude <list>       Comma-separated paths to ignore\n"
      << "  --extensions <list>    File extensions to load\n"
      << "                         (default: C and C++ sources and headers)\n"
      << "  --rules <list>         Rules to run, in order (default: all)\n"
      << "  --option <key=value>   Analyzer option applied to every project\n"
      << "  --severity <level>     Report diagnostics as warning or error\n"
      << "  --config <file>        YAML config file (default: <root>/"
      << stylefix::kDefaultConfigFileName << ")\n"
      << "  --log-level <level>    Logging verbosity "
         "(error,warn,info,debug,trace)\n"
      << "  --verbose              Shortcut for --log-level info\n"
      << "  --debug                Shortcut for --log-level debug\n"
      << "  --list-rules           Print the registered rules and exit\n"
      << "  --help                 Show this message\n";
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseSeverity(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "error") {
    return true;
  }
  if (normalized == "warning" || normalized == "warn") {
    return false;
  }
  throw std::invalid_argument("Unknown severity: " + value +
                              " (expected warning or error)");
}

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw_values) {
    if (character == ',') {
      if (!current.empty()) {
        values.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(character);
    }
  }
  if (!current.empty()) {
    values.push_back(current);
  }
  return values;
}

void AppendValues(const std::string &raw_values,
                  std::vector<std::string> &target) {
  for (auto value : SplitList(raw_values)) {
    value = Trim(value);
    if (value.empty()) {
      continue;
    }
    if (std::find(target.begin(), target.end(), value) == target.end()) {
      target.push_back(std::move(value));
    }
  }
}

void AppendPaths(const std::string &raw_paths,
                 std::vector<std::string> &target) {
  for (auto path_value : SplitList(raw_paths)) {
    path_value = Trim(path_value);
    if (path_value.empty()) {
      continue;
    }
    const auto normalized = std::filesystem::path(path_value).generic_string();
    if (std::find(target.begin(), target.end(), normalized) == target.end()) {
      target.push_back(normalized);
    }
  }
}

void AppendOption(const std::string &raw_option,
                  std::map<std::string, std::string> &target) {
  const auto separator = raw_option.find('=');
  if (separator == std::string::npos) {
    throw std::invalid_argument("--option expects key=value, got: " +
                                raw_option);
  }
  const auto key = Trim(raw_option.substr(0, separator));
  if (key.empty()) {
    throw std::invalid_argument("--option key cannot be empty");
  }
  target[key] = Trim(raw_option.substr(separator + 1));
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, RunOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level = stylefix::ParseLogLevel(
        RequireValue(arguments, index, std::string(argument)));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = stylefix::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = stylefix::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleListOption(const std::vector<std::string> &arguments,
                      std::size_t &index, RunOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--include") {
    AppendPaths(RequireValue(arguments, index, argument), options.include);
    return true;
  }
  if (argument == "--exclude") {
    AppendPaths(RequireValue(arguments, index, argument), options.exclude);
    return true;
  }
  if (argument == "--extensions") {
    AppendValues(RequireValue(arguments, index, argument), options.extensions);
    return true;
  }
  if (argument == "--rules") {
    AppendValues(RequireValue(arguments, index, argument), options.rules);
    return true;
  }
  if (argument == "--option") {
    AppendOption(RequireValue(arguments, index, argument), options.options);
    return true;
  }
  return false;
}

bool DispatchRunOption(const std::vector<std::string> &arguments,
                       std::size_t &index, RunOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--list-rules") {
    options.list_rules = true;
    return true;
  }
  if (argument == "--root") {
    options.root = RequireValue(arguments, index, "--root");
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, "--config");
    return true;
  }
  if (argument == "--severity") {
    options.changes_are_errors =
        ParseSeverity(RequireValue(arguments, index, "--severity"));
    return true;
  }
  if (HandleListOption(arguments, index, options)) {
    return true;
  }
  return HandleLoggingOption(arguments, index, options);
}

void ValidateRunOptions(const RunOptions &options) {
  if (!options.root) {
    throw std::invalid_argument("--root is required (or set in config file)");
  }
}

} // namespace

namespace stylefix {

using ConfigValue =
    std::variant<std::string, std::vector<std::string>,
                 std::map<std::string, std::string>,
                 std::map<std::string, std::map<std::string, std::string>>>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {
      "root",    "include",  "exclude",  "extensions", "rules",
      "options", "projects", "severity", "log_level"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"includes", "include"},
      {"excludes", "exclude"},
      {"ignored_paths", "exclude"},
      {"rule", "rules"},
      {"analyzer_options", "options"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string or path value");
  }
  return node.as<std::string>();
}

using ListAppender = void (*)(const std::string &, std::vector<std::string> &);

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name,
                                     ListAppender appender) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      appender(child.as<std::string>(), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    appender(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

std::map<std::string, std::string> ExtractScalarMap(const YAML::Node &node,
                                                    const std::string &key_name) {
  if (!node.IsMap()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a mapping of option values");
  }
  std::map<std::string, std::string> values;
  for (const auto &entry : node) {
    const auto option = Trim(entry.first.as<std::string>());
    values[option] = ExtractStringScalar(entry.second, key_name + "." + option);
  }
  return values;
}

std::map<std::string, std::map<std::string, std::string>>
ExtractProjectOptions(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsMap()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must map project names to options");
  }
  std::map<std::string, std::map<std::string, std::string>> projects;
  for (const auto &entry : node) {
    const auto project = Trim(entry.first.as<std::string>());
    projects[project] = ExtractScalarMap(entry.second, key_name + "." + project);
  }
  return projects;
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "include" || key == "exclude") {
    return ExtractList(node, key, AppendPaths);
  }
  if (key == "extensions" || key == "rules") {
    return ExtractList(node, key, AppendValues);
  }
  if (key == "options") {
    return ExtractScalarMap(node, key);
  }
  if (key == "projects") {
    return ExtractProjectOptions(node, key);
  }
  if (key == "root" || key == "severity" || key == "log_level") {
    return ConfigValue{ExtractStringScalar(node, key)};
  }
  ThrowUnknownKey(key);
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  const auto root = YAML::LoadFile(path.string());
  if (root.IsNull()) {
    return {};
  }
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyConfig(const RawConfig &config, const std::filesystem::path &path,
                 RunOptions &options) {
  for (const auto &[key, value] : config) {
    if (key == "root") {
      // Relative roots are anchored at the config file.
      std::filesystem::path root = std::get<std::string>(value);
      options.root = root.is_absolute() ? root : path.parent_path() / root;
      continue;
    }
    if (key == "include") {
      options.include = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "exclude") {
      options.exclude = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "extensions") {
      options.extensions = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "rules") {
      options.rules = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "options") {
      options.options = std::get<std::map<std::string, std::string>>(value);
      continue;
    }
    if (key == "projects") {
      options.project_options =
          std::get<std::map<std::string, std::map<std::string, std::string>>>(
              value);
      continue;
    }
    if (key == "severity") {
      options.changes_are_errors = ParseSeverity(std::get<std::string>(value));
      continue;
    }
    if (key == "log_level") {
      options.log_level = ParseLogLevel(std::get<std::string>(value));
      continue;
    }
    ThrowUnknownKey(key);
  }
}

RunOptions ParseRunArguments(const std::vector<std::string> &arguments) {
  RunOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchRunOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }
  return options;
}

RunOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  RunOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path), path, options);
  return options;
}

RunOptions MergeOptions(const RunOptions &config_options,
                        const RunOptions &cli_options) {
  RunOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };
  const auto override_list = [](auto &target, const auto &source) {
    if (!source.empty()) {
      target = source;
    }
  };

  override_value(merged.root, cli_options.root);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.changes_are_errors, cli_options.changes_are_errors);
  override_value(merged.log_level, cli_options.log_level);
  override_list(merged.include, cli_options.include);
  override_list(merged.exclude, cli_options.exclude);
  override_list(merged.extensions, cli_options.extensions);
  override_list(merged.rules, cli_options.rules);

  for (const auto &[key, value] : cli_options.options) {
    merged.options[key] = value;
  }
  for (const auto &[project, values] : cli_options.project_options) {
    for (const auto &[key, value] : values) {
      merged.project_options[project][key] = value;
    }
  }
  merged.list_rules = config_options.list_rules || cli_options.list_rules;
  merged.show_help = cli_options.show_help;
  return merged;
}

RunOptions ResolveRunOptions(const RunOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  RunOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  } else if (cli_options.root) {
    const auto discovered = *cli_options.root / kDefaultConfigFileName;
    if (std::filesystem::exists(discovered)) {
      config_options = ParseConfigFile(discovered);
    }
  }

  const auto merged = MergeOptions(config_options, cli_options);
  if (!merged.list_rules) {
    ValidateRunOptions(merged);
  }
  return merged;
}

FormatOptions BuildFormatOptions(const RunOptions &options, RunMode mode,
                                 const std::filesystem::path &root) {
  FormatOptions format_options;
  format_options.workspace_folder = root.string();
  format_options.save_formatted_files = mode == RunMode::kFix;
  format_options.changes_are_errors = options.changes_are_errors.value_or(false);
  return format_options;
}

LoggingConfig BuildLoggingConfig(const RunOptions &options) {
  LoggingConfig logging;
  logging.level = options.log_level.value_or(LogLevel::kWarn);
  return logging;
}

void PrintRules(const AnalyzerRegistry &registry, std::ostream &out) {
  for (const auto &name : registry.RuleNames()) {
    out << name << (registry.HasFixer(name) ? " (fixable)" : "") << "\n";
  }
}

std::map<std::string, OptionSet> BuildProjectOptions(const RunOptions &options) {
  std::map<std::string, OptionSet> project_options;
  for (const auto &[project, values] : options.project_options) {
    project_options.emplace(project, OptionSet(values));
  }
  return project_options;
}

FolderWorkspaceOptions BuildWorkspaceOptions(const RunOptions &options) {
  FolderWorkspaceOptions workspace_options;
  workspace_options.extensions = options.extensions;
  workspace_options.ignored_paths.assign(options.exclude.begin(),
                                         options.exclude.end());
  return workspace_options;
}

int RunCommand(RunMode mode, const std::vector<std::string> &arguments,
               std::ostream &out) {
  const auto cli_options = ParseRunArguments(arguments);
  if (cli_options.show_help) {
    PrintUsage(out);
    return kExitClean;
  }

  const auto merged = ResolveRunOptions(cli_options);
  const auto &registry = GlobalAnalyzerRegistry();
  if (merged.list_rules) {
    PrintRules(registry, out);
    return kExitClean;
  }

  const auto root = std::filesystem::weakly_canonical(*merged.root);
  auto logger = MakeLogger(BuildLoggingConfig(merged), std::clog);

  FolderWorkspaceLoader loader(BuildWorkspaceOptions(merged), logger);
  const std::vector<std::filesystem::path> includes(merged.include.begin(),
                                                    merged.include.end());
  const auto workspace = loader.Load(root, includes);

  auto orchestrator = AnalysisOrchestratorBuilder(registry)
                          .WithLogger(logger)
                          .WithRules(merged.rules)
                          .WithOptions(OptionSet(merged.options))
                          .WithProjectOptions(BuildProjectOptions(merged))
                          .Build();

  const auto format_options = BuildFormatOptions(merged, mode, root);
  const auto result =
      orchestrator->Format(workspace, FormattableDocuments(workspace),
                           format_options, CancellationToken::None());

  if (mode == RunMode::kFix) {
    const auto written =
        SaveChangedDocuments(workspace, result.workspace, *logger);
    out << "Formatted " << written.size() << " of "
        << workspace.DocumentCount() << " files.\n";
  } else if (result.diagnostic_count > 0) {
    out << result.diagnostic_count << " style diagnostics found.\n";
  }
  return FormatExitCode(result, format_options);
}

} // namespace stylefix
