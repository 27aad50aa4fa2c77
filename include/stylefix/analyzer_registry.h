#pragma once

#include <stylefix/interfaces.h>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace stylefix {

class AnalyzerRegistry {
public:
  using AnalyzerFactory = std::function<std::shared_ptr<Analyzer>()>;
  using FixerFactory = std::function<std::shared_ptr<CodeFixer>()>;

  // Rules keep their registration order; it is the default pair order.
  void RegisterRule(const std::string &name, AnalyzerFactory analyzer,
                    FixerFactory fixer = nullptr);

  AnalyzerFixerPair CreatePair(const std::string &name) const;
  bool HasFixer(const std::string &name) const;
  bool Contains(const std::string &name) const;

  std::vector<std::string> RuleNames() const { return order_; }

private:
  struct RuleFactories {
    AnalyzerFactory analyzer;
    FixerFactory fixer;
  };

  std::string JoinNames() const;

  std::unordered_map<std::string, RuleFactories> rules_;
  std::vector<std::string> order_;
};

AnalyzerRegistry MakeAnalyzerRegistryWithDefaults();
const AnalyzerRegistry &GlobalAnalyzerRegistry();

// Registry-backed finder: instantiates the enabled rules once, in order, and
// layers configured options over each project's own option set.
class ConfiguredAnalyzerFinder : public AnalyzerFinder {
public:
  ConfiguredAnalyzerFinder(
      const AnalyzerRegistry &registry,
      std::vector<std::string> enabled_rules = {}, OptionSet options = {},
      std::map<std::string, OptionSet> project_options = {});

  std::vector<AnalyzerFixerPair> GetAnalyzersAndFixers() const override;
  OptionSet GetAnalyzerOptions(const Project &project) const override;

private:
  std::vector<AnalyzerFixerPair> pairs_;
  OptionSet options_;
  std::map<std::string, OptionSet> project_options_;
};

} // namespace stylefix
