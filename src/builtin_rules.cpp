#include <stylefix/builtin_rules.h>

#include <algorithm>
#include <utility>

namespace stylefix {
namespace {

bool IsBlank(char character) { return character == ' ' || character == '\t'; }

template <typename LineVisitor>
void ForEachLine(const Document &document, LineVisitor visit) {
  for (std::size_t line = 0; line < document.LineCount(); ++line) {
    visit(document.LineStart(line), document.LineEnd(line));
  }
}

std::string DominantLineBreak(const std::string &text) {
  std::size_t crlf = 0;
  std::size_t lf = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '\n') {
      continue;
    }
    if (i > 0 && text[i - 1] == '\r') {
      ++crlf;
    } else {
      ++lf;
    }
  }
  return crlf > lf ? "\r\n" : "\n";
}

bool StillMatches(const Document &document, const TextSpan &span,
                  bool (*predicate)(char)) {
  if (span.End() > document.Text().size()) {
    return false;
  }
  const auto begin = document.Text().begin() +
                     static_cast<std::ptrdiff_t>(span.start);
  return std::all_of(begin, begin + static_cast<std::ptrdiff_t>(span.length),
                     predicate);
}

} // namespace

Diagnostic MakeDiagnostic(const std::string &id, const std::string &analyzer,
                          DiagnosticSeverity severity, std::string message,
                          const Document &document, TextSpan span) {
  Diagnostic diagnostic;
  diagnostic.id = id;
  diagnostic.analyzer = analyzer;
  diagnostic.severity = severity;
  diagnostic.message = std::move(message);
  diagnostic.document = document.Id();
  diagnostic.location.file_path = document.FilePath();
  diagnostic.location.span = span;
  diagnostic.location.line_span = document.GetLineSpan(span);
  return diagnostic;
}

std::vector<Diagnostic>
TabIndentationAnalyzer::Analyze(const Project &project,
                                const OptionSet &options,
                                const CancellationToken &token) {
  std::vector<Diagnostic> diagnostics;
  if (options.GetOr("indent_style", "space") == "tab") {
    return diagnostics;
  }

  for (const auto &document : project.Documents()) {
    if (token.IsCancellationRequested()) {
      break;
    }
    const auto &text = document->Text();
    ForEachLine(*document, [&](std::size_t start, std::size_t end) {
      for (auto offset = start; offset < end && IsBlank(text[offset]);
           ++offset) {
        if (text[offset] == '\t') {
          diagnostics.push_back(MakeDiagnostic(
              kTabIndentationId, Name(), DiagnosticSeverity::kWarning,
              "Replace tab indentation with spaces.", *document,
              TextSpan{offset, 1}));
        }
      }
    });
  }
  return diagnostics;
}

std::vector<TextEdit>
TabIndentationFixer::ComputeEdits(const Document &document,
                                  const std::vector<Diagnostic> &diagnostics,
                                  const CancellationToken &) {
  std::vector<TextEdit> edits;
  for (const auto &diagnostic : diagnostics) {
    const auto &span = diagnostic.location.span;
    if (StillMatches(document, span, [](char c) { return c == '\t'; })) {
      edits.push_back(TextEdit{span, " "});
    }
  }
  return edits;
}

std::vector<Diagnostic>
TrailingWhitespaceAnalyzer::Analyze(const Project &project,
                                    const OptionSet &options,
                                    const CancellationToken &token) {
  std::vector<Diagnostic> diagnostics;
  if (!options.GetBool("trim_trailing_whitespace", true)) {
    return diagnostics;
  }

  for (const auto &document : project.Documents()) {
    if (token.IsCancellationRequested()) {
      break;
    }
    const auto &text = document->Text();
    ForEachLine(*document, [&](std::size_t start, std::size_t end) {
      auto first_blank = end;
      while (first_blank > start && IsBlank(text[first_blank - 1])) {
        --first_blank;
      }
      if (first_blank == end) {
        return;
      }
      diagnostics.push_back(MakeDiagnostic(
          kTrailingWhitespaceId, Name(), DiagnosticSeverity::kWarning,
          "Remove trailing whitespace.", *document,
          TextSpan{first_blank, end - first_blank}));
    });
  }
  return diagnostics;
}

std::vector<TextEdit> TrailingWhitespaceFixer::ComputeEdits(
    const Document &document, const std::vector<Diagnostic> &diagnostics,
    const CancellationToken &) {
  std::vector<TextEdit> edits;
  for (const auto &diagnostic : diagnostics) {
    const auto &span = diagnostic.location.span;
    if (span.length > 0 && StillMatches(document, span, IsBlank)) {
      edits.push_back(TextEdit{span, ""});
    }
  }
  return edits;
}

std::vector<Diagnostic>
FinalNewlineAnalyzer::Analyze(const Project &project, const OptionSet &options,
                              const CancellationToken &token) {
  std::vector<Diagnostic> diagnostics;
  if (!options.GetBool("insert_final_newline", true)) {
    return diagnostics;
  }

  for (const auto &document : project.Documents()) {
    if (token.IsCancellationRequested()) {
      break;
    }
    const auto &text = document->Text();
    if (text.empty() || text.back() == '\n' || text.back() == '\r') {
      continue;
    }
    diagnostics.push_back(MakeDiagnostic(
        kFinalNewlineId, Name(), DiagnosticSeverity::kWarning,
        "Insert a final newline.", *document, TextSpan{text.size(), 0}));
  }
  return diagnostics;
}

std::vector<TextEdit>
FinalNewlineFixer::ComputeEdits(const Document &document,
                                const std::vector<Diagnostic> &diagnostics,
                                const CancellationToken &) {
  const auto &text = document.Text();
  if (diagnostics.empty() || text.empty() || text.back() == '\n' ||
      text.back() == '\r') {
    return {};
  }
  return {TextEdit{TextSpan{text.size(), 0}, DominantLineBreak(text)}};
}

std::vector<Diagnostic>
LineLengthAnalyzer::Analyze(const Project &project, const OptionSet &options,
                            const CancellationToken &token) {
  std::vector<Diagnostic> diagnostics;
  const auto limit = options.GetInt("max_line_length", kDefaultMaxLineLength);
  if (limit <= 0) {
    return diagnostics;
  }
  const auto max_length = static_cast<std::size_t>(limit);

  for (const auto &document : project.Documents()) {
    if (token.IsCancellationRequested()) {
      break;
    }
    ForEachLine(*document, [&](std::size_t start, std::size_t end) {
      if (end - start <= max_length) {
        return;
      }
      diagnostics.push_back(MakeDiagnostic(
          kLineLengthId, Name(), DiagnosticSeverity::kWarning,
          "Line exceeds " + std::to_string(max_length) + " characters (" +
              std::to_string(end - start) + ").",
          *document, TextSpan{start + max_length, end - start - max_length}));
    });
  }
  return diagnostics;
}

} // namespace stylefix
