#pragma once

#include <stylefix/analysis_orchestrator.h>
#include <stylefix/analyzer_registry.h>
#include <stylefix/interfaces.h>
#include <stylefix/logging.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace stylefix {

class AnalysisOrchestratorBuilder {
public:
  explicit AnalysisOrchestratorBuilder(
      const AnalyzerRegistry &registry = GlobalAnalyzerRegistry());

  AnalysisOrchestratorBuilder &
  WithFinder(std::shared_ptr<const AnalyzerFinder> finder);
  AnalysisOrchestratorBuilder &
  WithRunner(std::unique_ptr<AnalyzerRunner> runner);
  AnalysisOrchestratorBuilder &
  WithApplier(std::unique_ptr<CodeFixApplier> applier);
  AnalysisOrchestratorBuilder &WithLogger(std::shared_ptr<Logger> logger);
  AnalysisOrchestratorBuilder &WithRules(std::vector<std::string> rules);
  AnalysisOrchestratorBuilder &WithOptions(OptionSet options);
  AnalysisOrchestratorBuilder &
  WithProjectOptions(std::map<std::string, OptionSet> project_options);

  // Missing parts default to a registry-backed finder over the selected
  // rules, CodeAnalysisRunner and DefaultCodeFixApplier.
  std::unique_ptr<AnalysisOrchestrator> Build();

private:
  const AnalyzerRegistry *registry_;
  struct RuleSelections {
    std::vector<std::string> rules;
    OptionSet options;
    std::map<std::string, OptionSet> project_options;
  } selections_;
  std::shared_ptr<const AnalyzerFinder> finder_;
  std::unique_ptr<AnalyzerRunner> runner_;
  std::unique_ptr<CodeFixApplier> applier_;
  std::shared_ptr<Logger> logger_;
};

} // namespace stylefix
