#include <stylefix/analysis_orchestrator_builder.h>

#include <stylefix/code_analysis_runner.h>
#include <stylefix/code_fix_applier.h>

#include <utility>

namespace stylefix {

AnalysisOrchestratorBuilder::AnalysisOrchestratorBuilder(
    const AnalyzerRegistry &registry)
    : registry_(&registry) {}

AnalysisOrchestratorBuilder &AnalysisOrchestratorBuilder::WithFinder(
    std::shared_ptr<const AnalyzerFinder> finder) {
  finder_ = std::move(finder);
  return *this;
}

AnalysisOrchestratorBuilder &
AnalysisOrchestratorBuilder::WithRunner(std::unique_ptr<AnalyzerRunner> runner) {
  runner_ = std::move(runner);
  return *this;
}

AnalysisOrchestratorBuilder &AnalysisOrchestratorBuilder::WithApplier(
    std::unique_ptr<CodeFixApplier> applier) {
  applier_ = std::move(applier);
  return *this;
}

AnalysisOrchestratorBuilder &
AnalysisOrchestratorBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  logger_ = std::move(logger);
  return *this;
}

AnalysisOrchestratorBuilder &
AnalysisOrchestratorBuilder::WithRules(std::vector<std::string> rules) {
  selections_.rules = std::move(rules);
  return *this;
}

AnalysisOrchestratorBuilder &
AnalysisOrchestratorBuilder::WithOptions(OptionSet options) {
  selections_.options = std::move(options);
  return *this;
}

AnalysisOrchestratorBuilder &AnalysisOrchestratorBuilder::WithProjectOptions(
    std::map<std::string, OptionSet> project_options) {
  selections_.project_options = std::move(project_options);
  return *this;
}

std::unique_ptr<AnalysisOrchestrator> AnalysisOrchestratorBuilder::Build() {
  logger_ = EnsureLogger(std::move(logger_));
  finder_ = finder_ ? std::move(finder_)
                    : std::make_shared<ConfiguredAnalyzerFinder>(
                          *registry_, selections_.rules, selections_.options,
                          selections_.project_options);
  runner_ = runner_ ? std::move(runner_)
                    : std::make_unique<CodeAnalysisRunner>(logger_);
  applier_ = applier_ ? std::move(applier_)
                      : std::make_unique<DefaultCodeFixApplier>(logger_);
  return std::make_unique<AnalysisOrchestrator>(
      std::move(finder_), std::move(runner_), std::move(applier_), logger_);
}

} // namespace stylefix
