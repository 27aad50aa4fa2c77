#include <stylefix/analysis_result.h>

#include <algorithm>

namespace stylefix {

void AnalysisResult::AddDiagnostic(std::size_t analyzer_ordinal,
                                   const Diagnostic &diagnostic) {
  std::lock_guard<std::mutex> lock(mutex_);
  AddLocked(analyzer_ordinal, diagnostic);
}

void AnalysisResult::AddDiagnostics(std::size_t analyzer_ordinal,
                                    const std::vector<Diagnostic> &diagnostics) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &diagnostic : diagnostics) {
    AddLocked(analyzer_ordinal, diagnostic);
  }
}

void AnalysisResult::AddLocked(std::size_t analyzer_ordinal,
                               const Diagnostic &diagnostic) {
  auto &entries = entries_[diagnostic.document];
  const EntryKey key{analyzer_ordinal, diagnostic.location.span.start};

  // An identical diagnostic shares the ordinal and the span start.
  const auto [first, last] = entries.equal_range(key);
  for (auto entry = first; entry != last; ++entry) {
    if (entry->second == diagnostic) {
      return;
    }
  }
  entries.emplace_hint(last, key, diagnostic);
  ++count_;
}

std::map<DocumentId, std::vector<Diagnostic>>
AnalysisResult::Diagnostics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<DocumentId, std::vector<Diagnostic>> diagnostics;
  for (const auto &[document, entries] : entries_) {
    auto &target = diagnostics[document];
    target.reserve(entries.size());
    for (const auto &[key, diagnostic] : entries) {
      target.push_back(diagnostic);
    }
  }
  return diagnostics;
}

std::vector<Diagnostic>
AnalysisResult::DiagnosticsFor(const DocumentId &document) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Diagnostic> diagnostics;
  const auto found = entries_.find(document);
  if (found == entries_.end()) {
    return diagnostics;
  }
  diagnostics.reserve(found->second.size());
  for (const auto &[key, diagnostic] : found->second) {
    diagnostics.push_back(diagnostic);
  }
  return diagnostics;
}

std::vector<Diagnostic> AnalysisResult::AllDiagnostics() const {
  std::vector<Diagnostic> all;
  for (const auto &[document, diagnostics] : Diagnostics()) {
    all.insert(all.end(), diagnostics.begin(), diagnostics.end());
  }
  return all;
}

std::size_t AnalysisResult::Count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return count_;
}

std::size_t AnalysisResult::DocumentCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(entries_.begin(), entries_.end(),
                    [](const auto &entry) { return !entry.second.empty(); }));
}

bool AnalysisResult::HasDiagnostics() const { return Count() > 0; }

} // namespace stylefix
