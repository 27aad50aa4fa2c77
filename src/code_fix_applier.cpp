#include <stylefix/code_fix_applier.h>

#include <stylefix/analysis_result.h>
#include <stylefix/worker_pool.h>

#include <algorithm>
#include <exception>
#include <iterator>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace stylefix {
namespace {

struct DocumentFix {
  std::shared_ptr<const Document> document;
  std::vector<Diagnostic> diagnostics;
};

std::vector<DocumentFix>
CollectFixableDocuments(const Workspace &workspace,
                        const AnalysisResult &result, const CodeFixer &fixer,
                        Logger &logger) {
  const auto ids = fixer.FixableDiagnosticIds();
  const std::unordered_set<std::string> fixable(ids.begin(), ids.end());

  std::vector<DocumentFix> fixes;
  for (const auto &[document_id, diagnostics] : result.Diagnostics()) {
    DocumentFix fix;
    std::copy_if(diagnostics.begin(), diagnostics.end(),
                 std::back_inserter(fix.diagnostics),
                 [&](const Diagnostic &diagnostic) {
                   return fixable.count(diagnostic.id) != 0;
                 });
    if (fix.diagnostics.empty()) {
      continue;
    }
    fix.document = workspace.GetDocument(document_id);
    if (!fix.document) {
      logger.Log(LogLevel::kWarn, "fix.document.missing",
                 {{"fixer", fixer.Name()},
                  {"path", fix.diagnostics.front().location.file_path}});
      continue;
    }
    fixes.push_back(std::move(fix));
  }
  return fixes;
}

} // namespace

MergedEdits MergeTextEdits(std::vector<TextEdit> edits) {
  std::stable_sort(edits.begin(), edits.end(),
                   [](const TextEdit &left, const TextEdit &right) {
                     return left.span.start < right.span.start;
                   });

  MergedEdits merged;
  for (auto &edit : edits) {
    const auto overlaps =
        std::any_of(merged.accepted.begin(), merged.accepted.end(),
                    [&](const TextEdit &accepted) {
                      return accepted.span.OverlapsWith(edit.span);
                    });
    if (overlaps) {
      merged.rejected.push_back(std::move(edit));
    } else {
      merged.accepted.push_back(std::move(edit));
    }
  }
  return merged;
}

std::string ApplyTextEdits(const std::string &text,
                           const std::vector<TextEdit> &edits) {
  std::string output;
  output.reserve(text.size());
  std::size_t cursor = 0;
  for (const auto &edit : edits) {
    if (edit.span.End() > text.size() || edit.span.start < cursor) {
      throw std::out_of_range("Edit [" + std::to_string(edit.span.start) +
                              ", " + std::to_string(edit.span.End()) +
                              ") is outside of the document text");
    }
    output.append(text, cursor, edit.span.start - cursor);
    output.append(edit.new_text);
    cursor = edit.span.End();
  }
  output.append(text, cursor, std::string::npos);
  return output;
}

DefaultCodeFixApplier::DefaultCodeFixApplier(std::shared_ptr<Logger> logger,
                                             unsigned int max_workers)
    : logger_(EnsureLogger(std::move(logger))), max_workers_(max_workers) {}

Workspace DefaultCodeFixApplier::Apply(const Workspace &workspace,
                                       const AnalysisResult &result,
                                       CodeFixer &fixer,
                                       const CancellationToken &token) {
  const auto fixes = CollectFixableDocuments(workspace, result, fixer, *logger_);
  if (fixes.empty()) {
    return workspace;
  }

  std::vector<std::shared_ptr<const Document>> documents(fixes.size());
  WorkerPool pool(logger_, max_workers_);
  const auto errors = pool.ForEach(fixes.size(), [&](std::size_t index) {
    documents[index] = FixDocument(*fixes[index].document,
                                   fixes[index].diagnostics, fixer, token);
  });
  for (const auto &error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }

  std::vector<std::shared_ptr<const Document>> updated;
  for (auto &document : documents) {
    if (document) {
      updated.push_back(std::move(document));
    }
  }

  logger_->Log(LogLevel::kDebug, "fix.apply.complete",
               {{"fixer", fixer.Name()},
                {"documents", std::to_string(fixes.size())},
                {"updated", std::to_string(updated.size())}});
  if (updated.empty()) {
    return workspace;
  }
  return workspace.WithDocuments(updated);
}

std::shared_ptr<const Document>
DefaultCodeFixApplier::FixDocument(const Document &document,
                                   const std::vector<Diagnostic> &diagnostics,
                                   CodeFixer &fixer,
                                   const CancellationToken &token) const {
  if (token.IsCancellationRequested()) {
    return nullptr;
  }

  try {
    auto merged = MergeTextEdits(fixer.ComputeEdits(document, diagnostics, token));
    for (const auto &rejected : merged.rejected) {
      logger_->Log(LogLevel::kDebug, "fix.edit.rejected",
                   {{"fixer", fixer.Name()},
                    {"path", document.FilePath()},
                    {"start", std::to_string(rejected.span.start)},
                    {"length", std::to_string(rejected.span.length)}});
    }
    if (merged.accepted.empty()) {
      return nullptr;
    }

    auto text = ApplyTextEdits(document.Text(), merged.accepted);
    if (text == document.Text()) {
      return nullptr;
    }
    return document.WithText(std::move(text));
  } catch (const std::exception &error) {
    logger_->Log(LogLevel::kWarn, "fix.document.failed",
                 {{"fixer", fixer.Name()},
                  {"path", document.FilePath()},
                  {"error", error.what()}});
    return nullptr;
  }
}

} // namespace stylefix
