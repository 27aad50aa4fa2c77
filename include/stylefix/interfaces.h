#pragma once

#include <stylefix/cancellation.h>
#include <stylefix/models.h>
#include <stylefix/workspace.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace stylefix {

class AnalysisResult;

class Analyzer {
public:
  virtual ~Analyzer() = default;
  virtual std::string Name() const = 0;
  virtual std::vector<std::string> SupportedDiagnosticIds() const = 0;
  virtual std::vector<Diagnostic> Analyze(const Project &project,
                                          const OptionSet &options,
                                          const CancellationToken &token) = 0;
};

class CodeFixer {
public:
  virtual ~CodeFixer() = default;
  virtual std::string Name() const = 0;
  virtual std::vector<std::string> FixableDiagnosticIds() const = 0;
  virtual std::vector<TextEdit>
  ComputeEdits(const Document &document,
               const std::vector<Diagnostic> &diagnostics,
               const CancellationToken &token) = 0;
};

struct AnalyzerFixerPair {
  std::shared_ptr<Analyzer> analyzer;
  std::shared_ptr<CodeFixer> fixer;
};

class AnalyzerFinder {
public:
  virtual ~AnalyzerFinder() = default;
  virtual std::vector<AnalyzerFixerPair> GetAnalyzersAndFixers() const = 0;
  virtual OptionSet GetAnalyzerOptions(const Project &project) const = 0;
};

class AnalyzerRunner {
public:
  virtual ~AnalyzerRunner() = default;
  virtual void Run(AnalysisResult &result,
                   const std::vector<std::shared_ptr<Analyzer>> &analyzers,
                   const Project &project, const OptionSet &options,
                   const std::vector<std::string> &restrict_to_paths,
                   const CancellationToken &token) = 0;
};

class CodeFixApplier {
public:
  virtual ~CodeFixApplier() = default;
  virtual Workspace Apply(const Workspace &workspace,
                          const AnalysisResult &result, CodeFixer &fixer,
                          const CancellationToken &token) = 0;
};

struct FormatResult {
  Workspace workspace;
  // Fix mode sums the diagnostics found by every pair's sweep.
  std::size_t diagnostic_count = 0;
  std::size_t failed_projects = 0;
  std::vector<DocumentId> changed_documents;
  bool cancelled = false;
};

class CodeFormatter {
public:
  virtual ~CodeFormatter() = default;
  virtual FormatResult
  Format(const Workspace &workspace,
         const std::vector<FormattableDocument> &formattable_documents,
         const FormatOptions &options, const CancellationToken &token) = 0;
};

class WorkspaceLoader {
public:
  virtual ~WorkspaceLoader() = default;
  virtual Workspace
  Load(const std::filesystem::path &root,
       const std::vector<std::filesystem::path> &files_to_include) = 0;
};

} // namespace stylefix
