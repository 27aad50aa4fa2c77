#pragma once

#include <stylefix/interfaces.h>

#include <string>
#include <vector>

namespace stylefix {

constexpr const char kTabIndentationRule[] = "tab-indentation";
constexpr const char kTrailingWhitespaceRule[] = "trailing-whitespace";
constexpr const char kFinalNewlineRule[] = "final-newline";
constexpr const char kLineLengthRule[] = "line-length";

constexpr const char kTabIndentationId[] = "SF001";
constexpr const char kTrailingWhitespaceId[] = "SF002";
constexpr const char kFinalNewlineId[] = "SF003";
constexpr const char kLineLengthId[] = "SF004";

// Builds a diagnostic whose line span is resolved against `document`.
Diagnostic MakeDiagnostic(const std::string &id, const std::string &analyzer,
                          DiagnosticSeverity severity, std::string message,
                          const Document &document, TextSpan span);

// Flags tabs inside leading indentation. Off when `indent_style` is `tab`.
class TabIndentationAnalyzer : public Analyzer {
public:
  std::string Name() const override { return kTabIndentationRule; }
  std::vector<std::string> SupportedDiagnosticIds() const override {
    return {kTabIndentationId};
  }
  std::vector<Diagnostic> Analyze(const Project &project,
                                  const OptionSet &options,
                                  const CancellationToken &token) override;
};

// Replaces each flagged tab with a single space.
class TabIndentationFixer : public CodeFixer {
public:
  std::string Name() const override { return "TabIndentationFixer"; }
  std::vector<std::string> FixableDiagnosticIds() const override {
    return {kTabIndentationId};
  }
  std::vector<TextEdit> ComputeEdits(const Document &document,
                                     const std::vector<Diagnostic> &diagnostics,
                                     const CancellationToken &token) override;
};

// Off when `trim_trailing_whitespace` is false.
class TrailingWhitespaceAnalyzer : public Analyzer {
public:
  std::string Name() const override { return kTrailingWhitespaceRule; }
  std::vector<std::string> SupportedDiagnosticIds() const override {
    return {kTrailingWhitespaceId};
  }
  std::vector<Diagnostic> Analyze(const Project &project,
                                  const OptionSet &options,
                                  const CancellationToken &token) override;
};

class TrailingWhitespaceFixer : public CodeFixer {
public:
  std::string Name() const override { return "TrailingWhitespaceFixer"; }
  std::vector<std::string> FixableDiagnosticIds() const override {
    return {kTrailingWhitespaceId};
  }
  std::vector<TextEdit> ComputeEdits(const Document &document,
                                     const std::vector<Diagnostic> &diagnostics,
                                     const CancellationToken &token) override;
};

// Off when `insert_final_newline` is false.
class FinalNewlineAnalyzer : public Analyzer {
public:
  std::string Name() const override { return kFinalNewlineRule; }
  std::vector<std::string> SupportedDiagnosticIds() const override {
    return {kFinalNewlineId};
  }
  std::vector<Diagnostic> Analyze(const Project &project,
                                  const OptionSet &options,
                                  const CancellationToken &token) override;
};

// Appends the document's dominant line break.
class FinalNewlineFixer : public CodeFixer {
public:
  std::string Name() const override { return "FinalNewlineFixer"; }
  std::vector<std::string> FixableDiagnosticIds() const override {
    return {kFinalNewlineId};
  }
  std::vector<TextEdit> ComputeEdits(const Document &document,
                                     const std::vector<Diagnostic> &diagnostics,
                                     const CancellationToken &token) override;
};

// Report only. Limit from `max_line_length`, default 120.
class LineLengthAnalyzer : public Analyzer {
public:
  static constexpr int kDefaultMaxLineLength = 120;

  std::string Name() const override { return kLineLengthRule; }
  std::vector<std::string> SupportedDiagnosticIds() const override {
    return {kLineLengthId};
  }
  std::vector<Diagnostic> Analyze(const Project &project,
                                  const OptionSet &options,
                                  const CancellationToken &token) override;
};

} // namespace stylefix
