#include <stylefix/analyzer_registry.h>

#include <stylefix/builtin_rules.h>

#include <stdexcept>
#include <utility>

namespace stylefix {

void AnalyzerRegistry::RegisterRule(const std::string &name,
                                    AnalyzerFactory analyzer,
                                    FixerFactory fixer) {
  if (name.empty()) {
    throw std::invalid_argument("Rule name cannot be empty");
  }
  if (!analyzer) {
    throw std::invalid_argument("Analyzer factory for '" + name +
                                "' cannot be null");
  }
  if (rules_.count(name) != 0) {
    throw std::invalid_argument("Rule with name '" + name +
                                "' already registered");
  }
  rules_.emplace(name, RuleFactories{std::move(analyzer), std::move(fixer)});
  order_.push_back(name);
}

std::string AnalyzerRegistry::JoinNames() const {
  std::string message;
  for (std::size_t i = 0; i < order_.size(); ++i) {
    message += order_[i];
    if (i + 1 < order_.size()) {
      message += ", ";
    }
  }
  return message;
}

AnalyzerFixerPair AnalyzerRegistry::CreatePair(const std::string &name) const {
  const auto found = rules_.find(name);
  if (found == rules_.end()) {
    throw std::invalid_argument("Unknown rule '" + name +
                                "'. Registered: " + JoinNames());
  }

  AnalyzerFixerPair pair;
  pair.analyzer = found->second.analyzer();
  if (!pair.analyzer) {
    throw std::runtime_error("Analyzer factory for '" + name +
                             "' returned null");
  }
  if (found->second.fixer) {
    pair.fixer = found->second.fixer();
    if (!pair.fixer) {
      throw std::runtime_error("Fixer factory for '" + name +
                               "' returned null");
    }
  }
  return pair;
}

bool AnalyzerRegistry::HasFixer(const std::string &name) const {
  const auto found = rules_.find(name);
  return found != rules_.end() && static_cast<bool>(found->second.fixer);
}

bool AnalyzerRegistry::Contains(const std::string &name) const {
  return rules_.count(name) != 0;
}

AnalyzerRegistry MakeAnalyzerRegistryWithDefaults() {
  AnalyzerRegistry registry;
  registry.RegisterRule(
      kTabIndentationRule,
      []() { return std::make_shared<TabIndentationAnalyzer>(); },
      []() { return std::make_shared<TabIndentationFixer>(); });
  registry.RegisterRule(
      kTrailingWhitespaceRule,
      []() { return std::make_shared<TrailingWhitespaceAnalyzer>(); },
      []() { return std::make_shared<TrailingWhitespaceFixer>(); });
  registry.RegisterRule(
      kFinalNewlineRule,
      []() { return std::make_shared<FinalNewlineAnalyzer>(); },
      []() { return std::make_shared<FinalNewlineFixer>(); });
  registry.RegisterRule(kLineLengthRule, []() {
    return std::make_shared<LineLengthAnalyzer>();
  });
  return registry;
}

const AnalyzerRegistry &GlobalAnalyzerRegistry() {
  static const AnalyzerRegistry registry = MakeAnalyzerRegistryWithDefaults();
  return registry;
}

ConfiguredAnalyzerFinder::ConfiguredAnalyzerFinder(
    const AnalyzerRegistry &registry, std::vector<std::string> enabled_rules,
    OptionSet options, std::map<std::string, OptionSet> project_options)
    : options_(std::move(options)),
      project_options_(std::move(project_options)) {
  if (enabled_rules.empty()) {
    enabled_rules = registry.RuleNames();
  }
  pairs_.reserve(enabled_rules.size());
  for (const auto &name : enabled_rules) {
    pairs_.push_back(registry.CreatePair(name));
  }
}

std::vector<AnalyzerFixerPair>
ConfiguredAnalyzerFinder::GetAnalyzersAndFixers() const {
  return pairs_;
}

OptionSet
ConfiguredAnalyzerFinder::GetAnalyzerOptions(const Project &project) const {
  auto options = project.Options().MergedWith(options_);
  const auto found = project_options_.find(project.Name());
  if (found != project_options_.end()) {
    options = options.MergedWith(found->second);
  }
  return options;
}

} // namespace stylefix
