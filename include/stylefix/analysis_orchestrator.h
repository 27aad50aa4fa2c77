#pragma once

#include <stylefix/interfaces.h>
#include <stylefix/logging.h>

#include <atomic>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace stylefix {

// The analyzer/fixer set cannot be run at all. Raised before any sweep.
class ConfigurationError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

enum class OrchestratorState { kIdle, kAnalyzing, kReporting, kFixingPair };

std::string StateName(OrchestratorState state);

// `relative/path(line,col): message`, with 1-based line and column taken
// from the mapped start of the diagnostic.
std::string FormatDiagnosticLine(const Diagnostic &diagnostic,
                                 const std::string &workspace_folder);

class AnalysisOrchestrator : public CodeFormatter {
public:
  AnalysisOrchestrator(std::shared_ptr<const AnalyzerFinder> finder,
                       std::unique_ptr<AnalyzerRunner> runner,
                       std::unique_ptr<CodeFixApplier> applier,
                       std::shared_ptr<Logger> logger = nullptr);

  // Report mode when `options.save_formatted_files` is false: diagnostics
  // are logged and `workspace` is returned untouched. Fix mode otherwise:
  // every analyzer/fixer pair is analyzed and fixed in declared order, each
  // pair seeing the snapshot left by the previous one. This is a single pass
  // over the pairs; a later fixer may reintroduce what an earlier one fixed.
  //
  // Not reentrant: one Format call per orchestrator at a time.
  FormatResult Format(const Workspace &workspace,
                      const std::vector<FormattableDocument> &formattable_documents,
                      const FormatOptions &options,
                      const CancellationToken &token) override;

  OrchestratorState State() const { return state_.load(); }

private:
  struct SweepOutcome {
    std::size_t failed_projects = 0;
    bool cancelled = false;
  };

  SweepOutcome RunSweep(AnalysisResult &result,
                        const std::vector<std::shared_ptr<Analyzer>> &analyzers,
                        const Workspace &workspace,
                        const std::vector<std::string> &paths,
                        const CancellationToken &token);

  FormatResult LogDiagnostics(const Workspace &workspace,
                              const std::vector<AnalyzerFixerPair> &pairs,
                              const std::vector<std::string> &paths,
                              const FormatOptions &options,
                              const CancellationToken &token);

  FormatResult FixDiagnostics(const Workspace &workspace,
                              const std::vector<AnalyzerFixerPair> &pairs,
                              const std::vector<std::string> &paths,
                              const CancellationToken &token);

  void LogDiagnosticLocations(const AnalysisResult &result,
                              const FormatOptions &options);

  std::shared_ptr<const AnalyzerFinder> finder_;
  std::unique_ptr<AnalyzerRunner> runner_;
  std::unique_ptr<CodeFixApplier> applier_;
  std::shared_ptr<Logger> logger_;
  std::atomic<OrchestratorState> state_{OrchestratorState::kIdle};
};

} // namespace stylefix
