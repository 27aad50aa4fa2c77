#include <stylefix/code_analysis_runner.h>

#include <stylefix/analysis_result.h>

#include <chrono>
#include <unordered_set>
#include <utility>

namespace stylefix {
namespace {

struct PendingDiagnostics {
  std::size_t ordinal = 0;
  std::vector<Diagnostic> diagnostics;
};

std::unordered_set<DocumentId>
SelectDocuments(const Project &project,
                const std::vector<std::string> &restrict_to_paths) {
  const std::unordered_set<std::string> allowed(restrict_to_paths.begin(),
                                                restrict_to_paths.end());
  std::unordered_set<DocumentId> selected;
  for (const auto &document : project.Documents()) {
    if (allowed.empty() || allowed.count(document->FilePath()) != 0) {
      selected.insert(document->Id());
    }
  }
  return selected;
}

} // namespace

ProjectAnalysisError::ProjectAnalysisError(std::string project,
                                           std::string analyzer,
                                           const std::string &reason)
    : std::runtime_error("Analyzer '" + analyzer + "' failed on project '" +
                         project + "': " + reason),
      project_(std::move(project)), analyzer_(std::move(analyzer)) {}

CodeAnalysisRunner::CodeAnalysisRunner(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

void CodeAnalysisRunner::Run(
    AnalysisResult &result,
    const std::vector<std::shared_ptr<Analyzer>> &analyzers,
    const Project &project, const OptionSet &options,
    const std::vector<std::string> &restrict_to_paths,
    const CancellationToken &token) {
  if (analyzers.empty()) {
    throw std::invalid_argument("No analyzers supplied for project '" +
                                project.Name() + "'");
  }

  const auto selected = SelectDocuments(project, restrict_to_paths);
  if (selected.empty()) {
    logger_->Log(LogLevel::kTrace, "runner.project.skipped",
                 {{"project", project.Name()}, {"reason", "no documents"}});
    return;
  }

  const auto start = std::chrono::steady_clock::now();
  std::vector<PendingDiagnostics> pending;
  pending.reserve(analyzers.size());

  for (std::size_t ordinal = 0; ordinal < analyzers.size(); ++ordinal) {
    if (token.IsCancellationRequested()) {
      logger_->Log(LogLevel::kDebug, "runner.project.cancelled",
                   {{"project", project.Name()}});
      return;
    }

    const auto &analyzer = analyzers[ordinal];
    if (!analyzer) {
      throw std::invalid_argument("Null analyzer scheduled for project '" +
                                  project.Name() + "'");
    }

    std::vector<Diagnostic> diagnostics;
    try {
      diagnostics = analyzer->Analyze(project, options, token);
    } catch (const std::exception &error) {
      throw ProjectAnalysisError(project.Name(), analyzer->Name(),
                                 error.what());
    }

    PendingDiagnostics batch{ordinal, {}};
    for (auto &diagnostic : diagnostics) {
      if (selected.count(diagnostic.document) != 0) {
        batch.diagnostics.push_back(std::move(diagnostic));
      }
    }
    logger_->Log(LogLevel::kTrace, "runner.analyzer.complete",
                 {{"project", project.Name()},
                  {"analyzer", analyzer->Name()},
                  {"diagnostics", std::to_string(batch.diagnostics.size())}});
    pending.push_back(std::move(batch));
  }

  if (token.IsCancellationRequested()) {
    logger_->Log(LogLevel::kDebug, "runner.project.cancelled",
                 {{"project", project.Name()}});
    return;
  }

  std::size_t retained = 0;
  for (const auto &batch : pending) {
    result.AddDiagnostics(batch.ordinal, batch.diagnostics);
    retained += batch.diagnostics.size();
  }

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count();
  logger_->Log(LogLevel::kDebug, "runner.project.complete",
               {{"project", project.Name()},
                {"analyzers", std::to_string(analyzers.size())},
                {"diagnostics", std::to_string(retained)},
                {"duration_ms", std::to_string(duration_ms)}});
}

} // namespace stylefix
