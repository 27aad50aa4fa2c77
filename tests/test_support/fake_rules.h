#ifndef STYLEFIX_TEST_SUPPORT_FAKE_RULES_H
#define STYLEFIX_TEST_SUPPORT_FAKE_RULES_H

#include <stylefix/builtin_rules.h>
#include <stylefix/interfaces.h>
#include <stylefix/workspace.h>

#include <atomic>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace stylefix {
namespace test {

struct DocumentSpec {
  std::string path;
  std::string text;
};

inline Workspace
MakeWorkspace(const std::vector<std::vector<DocumentSpec>> &projects) {
  std::vector<std::shared_ptr<const Project>> built;
  for (std::size_t i = 0; i < projects.size(); ++i) {
    const auto project_id = NewProjectId();
    std::vector<std::shared_ptr<const Document>> documents;
    for (const auto &spec : projects[i]) {
      documents.push_back(std::make_shared<const Document>(
          NewDocumentId(project_id), spec.path, spec.path, spec.text));
    }
    built.push_back(std::make_shared<const Project>(
        project_id, "project" + std::to_string(i), "/workspace", "C++",
        std::move(documents)));
  }
  return Workspace(std::move(built));
}

inline OptionSet MakeOptions(std::map<std::string, std::string> values) {
  return OptionSet(std::move(values));
}

inline std::shared_ptr<const Document> FindDocument(const Workspace &workspace,
                                                    const std::string &path) {
  for (const auto &project : workspace.Projects()) {
    if (auto document = project->FindDocumentByPath(path)) {
      return document;
    }
  }
  return nullptr;
}

// Flags every occurrence of a fixed pattern.
class PatternAnalyzer : public Analyzer {
public:
  PatternAnalyzer(std::string name, std::string id, std::string pattern)
      : name_(std::move(name)), id_(std::move(id)),
        pattern_(std::move(pattern)) {}

  std::string Name() const override { return name_; }
  std::vector<std::string> SupportedDiagnosticIds() const override {
    return {id_};
  }

  std::vector<Diagnostic> Analyze(const Project &project, const OptionSet &,
                                  const CancellationToken &) override {
    ++calls;
    std::vector<Diagnostic> diagnostics;
    for (const auto &document : project.Documents()) {
      auto position = document->Text().find(pattern_);
      while (position != std::string::npos) {
        diagnostics.push_back(MakeDiagnostic(
            id_, name_, DiagnosticSeverity::kWarning, "Found " + pattern_,
            *document, TextSpan{position, pattern_.size()}));
        position = document->Text().find(pattern_, position + pattern_.size());
      }
    }
    return diagnostics;
  }

  std::atomic<int> calls{0};

private:
  std::string name_;
  std::string id_;
  std::string pattern_;
};

// Replaces each diagnostic span; throws for documents listed as failing.
class ReplacementFixer : public CodeFixer {
public:
  ReplacementFixer(std::string id, std::string replacement,
                   std::set<std::string> failing_paths = {})
      : id_(std::move(id)), replacement_(std::move(replacement)),
        failing_paths_(std::move(failing_paths)) {}

  std::string Name() const override { return "ReplacementFixer(" + id_ + ")"; }
  std::vector<std::string> FixableDiagnosticIds() const override {
    return {id_};
  }

  std::vector<TextEdit> ComputeEdits(const Document &document,
                                     const std::vector<Diagnostic> &diagnostics,
                                     const CancellationToken &) override {
    ++calls;
    if (failing_paths_.count(document.FilePath()) != 0) {
      throw std::runtime_error("cannot fix " + document.FilePath());
    }
    std::vector<TextEdit> edits;
    for (const auto &diagnostic : diagnostics) {
      edits.push_back(TextEdit{diagnostic.location.span, replacement_});
    }
    return edits;
  }

  std::atomic<int> calls{0};

private:
  std::string id_;
  std::string replacement_;
  std::set<std::string> failing_paths_;
};

class StaticAnalyzerFinder : public AnalyzerFinder {
public:
  explicit StaticAnalyzerFinder(std::vector<AnalyzerFixerPair> pairs,
                                OptionSet options = {})
      : pairs_(std::move(pairs)), options_(std::move(options)) {}

  std::vector<AnalyzerFixerPair> GetAnalyzersAndFixers() const override {
    return pairs_;
  }
  OptionSet GetAnalyzerOptions(const Project &project) const override {
    return project.Options().MergedWith(options_);
  }

private:
  std::vector<AnalyzerFixerPair> pairs_;
  OptionSet options_;
};

} // namespace test
} // namespace stylefix

#endif // STYLEFIX_TEST_SUPPORT_FAKE_RULES_H
