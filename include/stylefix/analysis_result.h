#pragma once

#include <stylefix/models.h>

#include <cstddef>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace stylefix {

// Diagnostics collected by one sweep, keyed by document.
//
// Appends may come from any number of concurrent analyzer runs. Each
// document's list is kept ordered by the ordinal of the analyzer that
// produced the entry (its position in the scheduled batch) and then by
// source position, so reporting does not depend on which run finished
// first. Re-adding an identical diagnostic for the same analyzer ordinal is
// a no-op.
class AnalysisResult {
public:
  AnalysisResult() = default;
  AnalysisResult(const AnalysisResult &) = delete;
  AnalysisResult &operator=(const AnalysisResult &) = delete;

  void AddDiagnostic(std::size_t analyzer_ordinal, const Diagnostic &diagnostic);
  void AddDiagnostics(std::size_t analyzer_ordinal,
                      const std::vector<Diagnostic> &diagnostics);

  std::map<DocumentId, std::vector<Diagnostic>> Diagnostics() const;
  std::vector<Diagnostic> DiagnosticsFor(const DocumentId &document) const;
  std::vector<Diagnostic> AllDiagnostics() const;

  std::size_t Count() const;
  std::size_t DocumentCount() const;
  bool HasDiagnostics() const;

private:
  // (analyzer ordinal, span start). A multimap appends equal keys after the
  // ones already present.
  using EntryKey = std::pair<std::size_t, std::size_t>;
  using Entries = std::multimap<EntryKey, Diagnostic>;

  void AddLocked(std::size_t analyzer_ordinal, const Diagnostic &diagnostic);

  mutable std::mutex mutex_;
  std::map<DocumentId, Entries> entries_;
  std::size_t count_ = 0;
};

} // namespace stylefix
