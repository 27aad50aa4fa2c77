#pragma once

#include <stylefix/interfaces.h>
#include <stylefix/logging.h>

#include <memory>
#include <string>
#include <vector>

namespace stylefix {

struct MergedEdits {
  std::vector<TextEdit> accepted;
  std::vector<TextEdit> rejected;
};

// Orders edits by start offset (ties keep the fixer's order) and drops every
// edit that overlaps one accepted before it.
MergedEdits MergeTextEdits(std::vector<TextEdit> edits);

// Throws std::out_of_range when an edit reaches past the end of `text`.
std::string ApplyTextEdits(const std::string &text,
                           const std::vector<TextEdit> &edits);

class DefaultCodeFixApplier : public CodeFixApplier {
public:
  // `max_workers == 0` uses one thread per hardware thread.
  explicit DefaultCodeFixApplier(std::shared_ptr<Logger> logger = nullptr,
                                 unsigned int max_workers = 0);

  // Fixes every document holding a diagnostic the fixer can handle. Each
  // document is computed independently on a bounded set of threads; a
  // document whose fix fails keeps its original content. After
  // cancellation no new document is started, and documents whose edits
  // were already computed are kept.
  Workspace Apply(const Workspace &workspace, const AnalysisResult &result,
                  CodeFixer &fixer, const CancellationToken &token) override;

private:
  std::shared_ptr<const Document>
  FixDocument(const Document &document,
              const std::vector<Diagnostic> &diagnostics, CodeFixer &fixer,
              const CancellationToken &token) const;

  std::shared_ptr<Logger> logger_;
  unsigned int max_workers_;
};

} // namespace stylefix
