#include <stylefix/analysis_orchestrator.h>

#include <stylefix/analysis_result.h>
#include <stylefix/code_analysis_runner.h>
#include <stylefix/worker_pool.h>

#include <chrono>
#include <filesystem>
#include <exception>
#include <utility>

namespace stylefix {
namespace {

class IdleOnExit {
public:
  explicit IdleOnExit(std::atomic<OrchestratorState> &state) : state_(state) {}
  ~IdleOnExit() { state_.store(OrchestratorState::kIdle); }

  IdleOnExit(const IdleOnExit &) = delete;
  IdleOnExit &operator=(const IdleOnExit &) = delete;

private:
  std::atomic<OrchestratorState> &state_;
};

void ValidatePairs(const std::vector<AnalyzerFixerPair> &pairs) {
  if (pairs.empty()) {
    throw ConfigurationError("No analyzers registered");
  }
  for (std::size_t i = 0; i < pairs.size(); ++i) {
    if (!pairs[i].analyzer) {
      throw ConfigurationError("Analyzer/fixer pair " + std::to_string(i) +
                               " has no analyzer");
    }
  }
}

std::vector<std::string>
FormattablePaths(const std::vector<FormattableDocument> &documents) {
  std::vector<std::string> paths;
  paths.reserve(documents.size());
  for (const auto &document : documents) {
    paths.push_back(document.file_path);
  }
  return paths;
}

std::string RelativePath(const std::string &path,
                         const std::string &workspace_folder) {
  if (workspace_folder.empty()) {
    return std::filesystem::path(path).generic_string();
  }
  const auto relative = std::filesystem::path(path).lexically_relative(
      std::filesystem::path(workspace_folder));
  if (relative.empty()) {
    return std::filesystem::path(path).generic_string();
  }
  return relative.generic_string();
}

} // namespace

std::string StateName(OrchestratorState state) {
  switch (state) {
  case OrchestratorState::kIdle:
    return "idle";
  case OrchestratorState::kAnalyzing:
    return "analyzing";
  case OrchestratorState::kReporting:
    return "reporting";
  case OrchestratorState::kFixingPair:
    return "fixing";
  }
  return "unknown";
}

std::string FormatDiagnosticLine(const Diagnostic &diagnostic,
                                 const std::string &workspace_folder) {
  const auto &position = diagnostic.location.GetMappedLineSpan().start;
  return RelativePath(diagnostic.location.file_path, workspace_folder) + "(" +
         std::to_string(position.line + 1) + "," +
         std::to_string(position.character + 1) + "): " + diagnostic.message;
}

AnalysisOrchestrator::AnalysisOrchestrator(
    std::shared_ptr<const AnalyzerFinder> finder,
    std::unique_ptr<AnalyzerRunner> runner,
    std::unique_ptr<CodeFixApplier> applier, std::shared_ptr<Logger> logger)
    : finder_(std::move(finder)), runner_(std::move(runner)),
      applier_(std::move(applier)), logger_(EnsureLogger(std::move(logger))) {
  if (!finder_ || !runner_ || !applier_) {
    throw std::invalid_argument(
        "AnalysisOrchestrator requires a finder, a runner and an applier");
  }
}

FormatResult AnalysisOrchestrator::Format(
    const Workspace &workspace,
    const std::vector<FormattableDocument> &formattable_documents,
    const FormatOptions &options, const CancellationToken &token) {
  const auto pairs = finder_->GetAnalyzersAndFixers();
  ValidatePairs(pairs);

  IdleOnExit idle_on_exit(state_);
  const auto start = std::chrono::steady_clock::now();
  logger_->Log(LogLevel::kTrace, "Analyzing code style.",
               {{"pairs", std::to_string(pairs.size())},
                {"documents", std::to_string(formattable_documents.size())},
                {"mode", options.save_formatted_files ? "fix" : "report"}});

  const auto paths = FormattablePaths(formattable_documents);
  auto result = options.save_formatted_files
                    ? FixDiagnostics(workspace, pairs, paths, token)
                    : LogDiagnostics(workspace, pairs, paths, options, token);

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count();
  logger_->Log(LogLevel::kTrace, "Analysis complete.",
               {{"duration_ms", std::to_string(duration_ms)},
                {"diagnostics", std::to_string(result.diagnostic_count)},
                {"cancelled", result.cancelled ? "true" : "false"}});
  return result;
}

AnalysisOrchestrator::SweepOutcome AnalysisOrchestrator::RunSweep(
    AnalysisResult &result,
    const std::vector<std::shared_ptr<Analyzer>> &analyzers,
    const Workspace &workspace, const std::vector<std::string> &paths,
    const CancellationToken &token) {
  const auto &projects = workspace.Projects();
  WorkerPool pool(logger_);
  const auto errors = pool.ForEach(projects.size(), [&](std::size_t index) {
    if (token.IsCancellationRequested()) {
      return;
    }
    const auto &project = *projects[index];
    const auto project_options = finder_->GetAnalyzerOptions(project);
    runner_->Run(result, analyzers, project, project_options, paths, token);
  });

  // Every project has finished here, failed or not.
  SweepOutcome outcome;
  for (std::size_t i = 0; i < errors.size(); ++i) {
    if (!errors[i]) {
      continue;
    }
    try {
      std::rethrow_exception(errors[i]);
    } catch (const ProjectAnalysisError &error) {
      ++outcome.failed_projects;
      logger_->Log(LogLevel::kError, "analysis.project.failed",
                   {{"project", error.Project()},
                    {"analyzer", error.AnalyzerName()},
                    {"error", error.what()}});
    } catch (const std::exception &error) {
      ++outcome.failed_projects;
      logger_->Log(LogLevel::kError, "analysis.project.failed",
                   {{"project", projects[i]->Name()}, {"error", error.what()}});
    }
  }
  outcome.cancelled = token.IsCancellationRequested();
  return outcome;
}

FormatResult AnalysisOrchestrator::LogDiagnostics(
    const Workspace &workspace, const std::vector<AnalyzerFixerPair> &pairs,
    const std::vector<std::string> &paths, const FormatOptions &options,
    const CancellationToken &token) {
  // Fixes are never computed here since nothing would be persisted.
  std::vector<std::shared_ptr<Analyzer>> analyzers;
  analyzers.reserve(pairs.size());
  for (const auto &pair : pairs) {
    analyzers.push_back(pair.analyzer);
  }

  state_.store(OrchestratorState::kAnalyzing);
  AnalysisResult analysis;
  const auto outcome = RunSweep(analysis, analyzers, workspace, paths, token);

  state_.store(OrchestratorState::kReporting);
  LogDiagnosticLocations(analysis, options);

  FormatResult result;
  result.workspace = workspace;
  result.diagnostic_count = analysis.Count();
  result.failed_projects = outcome.failed_projects;
  result.cancelled = outcome.cancelled;
  return result;
}

FormatResult AnalysisOrchestrator::FixDiagnostics(
    const Workspace &workspace, const std::vector<AnalyzerFixerPair> &pairs,
    const std::vector<std::string> &paths, const CancellationToken &token) {
  FormatResult result;
  auto current = workspace;

  for (std::size_t index = 0; index < pairs.size(); ++index) {
    if (token.IsCancellationRequested()) {
      result.cancelled = true;
      break;
    }

    const auto &pair = pairs[index];
    if (!pair.fixer) {
      logger_->Log(LogLevel::kTrace, "No fixer registered; skipping.",
                   {{"analyzer", pair.analyzer->Name()}});
      continue;
    }

    state_.store(OrchestratorState::kAnalyzing);
    AnalysisResult analysis;
    const auto outcome =
        RunSweep(analysis, {pair.analyzer}, current, paths, token);
    result.failed_projects += outcome.failed_projects;
    if (outcome.cancelled) {
      result.cancelled = true;
      break;
    }

    result.diagnostic_count += analysis.Count();
    if (!analysis.HasDiagnostics()) {
      continue;
    }

    state_.store(OrchestratorState::kFixingPair);
    logger_->Log(LogLevel::kTrace, "Applying fixes.",
                 {{"fixer", pair.fixer->Name()},
                  {"diagnostics", std::to_string(analysis.Count())}});
    auto fixed = applier_->Apply(current, analysis, *pair.fixer, token);
    if (fixed.HasChangesFrom(current)) {
      current = std::move(fixed);
    }
    if (token.IsCancellationRequested()) {
      result.cancelled = true;
      break;
    }
  }

  result.changed_documents = current.GetChangedDocuments(workspace);
  result.workspace = std::move(current);
  return result;
}

void AnalysisOrchestrator::LogDiagnosticLocations(
    const AnalysisResult &result, const FormatOptions &options) {
  const auto level =
      options.changes_are_errors ? LogLevel::kError : LogLevel::kWarn;
  for (const auto &diagnostic : result.AllDiagnostics()) {
    logger_->Log(level,
                 FormatDiagnosticLine(diagnostic, options.workspace_folder),
                 {{"rule", diagnostic.id}, {"analyzer", diagnostic.analyzer}});
  }
}

} // namespace stylefix
