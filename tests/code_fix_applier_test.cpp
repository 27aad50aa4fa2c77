#include <stylefix/analysis_result.h>
#include <stylefix/cancellation.h>
#include <stylefix/code_analysis_runner.h>
#include <stylefix/code_fix_applier.h>

#include "test_support/fake_rules.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace stylefix {
namespace {

using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::HasSubstr;

// Requests cancellation after computing the edits of the first document it
// sees, and remembers every document it was asked to fix.
class CancellingFixer : public test::ReplacementFixer {
public:
  explicit CancellingFixer(CancellationSource &source)
      : ReplacementFixer("T1", " "), source_(source) {}

  std::vector<TextEdit> ComputeEdits(const Document &document,
                                     const std::vector<Diagnostic> &diagnostics,
                                     const CancellationToken &token) override {
    auto edits = ReplacementFixer::ComputeEdits(document, diagnostics, token);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      seen_.insert(document.FilePath());
    }
    source_.Cancel();
    return edits;
  }

  std::set<std::string> Seen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_;
  }

private:
  CancellationSource &source_;
  mutable std::mutex mutex_;
  std::set<std::string> seen_;
};

TextEdit Edit(std::size_t start, std::size_t length, std::string text) {
  return TextEdit{TextSpan{start, length}, std::move(text)};
}

TEST(MergeTextEditsTest, SortsByStartAndRejectsOverlaps) {
  const auto merged = MergeTextEdits(
      {Edit(6, 2, "b"), Edit(0, 3, "a"), Edit(2, 2, "x"), Edit(8, 0, "c")});

  EXPECT_THAT(merged.accepted,
              ElementsAre(Field(&TextEdit::new_text, "a"),
                          Field(&TextEdit::new_text, "b"),
                          Field(&TextEdit::new_text, "c")));
  EXPECT_THAT(merged.rejected, ElementsAre(Field(&TextEdit::new_text, "x")));
}

TEST(MergeTextEditsTest, KeepsFixerOrderForEqualStarts) {
  const auto merged = MergeTextEdits({Edit(4, 0, "first"), Edit(4, 0, "second")});

  EXPECT_THAT(merged.accepted, ElementsAre(Field(&TextEdit::new_text, "first")));
  EXPECT_THAT(merged.rejected,
              ElementsAre(Field(&TextEdit::new_text, "second")));
}

TEST(ApplyTextEditsTest, AppliesEditsAgainstOriginalOffsets) {
  EXPECT_EQ("\t\tint x;", ApplyTextEdits("  int y;", {Edit(0, 1, "\t"),
                                                       Edit(1, 1, "\t"),
                                                       Edit(6, 1, "x")}));
  EXPECT_EQ("abc\n", ApplyTextEdits("abc", {Edit(3, 0, "\n")}));
}

TEST(ApplyTextEditsTest, RejectsEditsPastTheEnd) {
  EXPECT_THROW(ApplyTextEdits("abc", {Edit(2, 5, "")}), std::out_of_range);
}

class CodeFixApplierTest : public ::testing::Test {
protected:
  void Analyze(const Workspace &workspace, Analyzer &analyzer) {
    std::shared_ptr<Analyzer> shared(&analyzer, [](Analyzer *) {});
    for (const auto &project : workspace.Projects()) {
      runner_.Run(result_, {shared}, *project, OptionSet(), {},
                  CancellationToken::None());
    }
  }

  std::stringstream log_;
  std::shared_ptr<Logger> logger_ =
      MakeLogger(LoggingConfig{LogLevel::kDebug}, log_);
  CodeAnalysisRunner runner_;
  AnalysisResult result_;
  DefaultCodeFixApplier applier_{logger_};
  test::PatternAnalyzer analyzer_{"tab", "T1", "\t"};
};

TEST_F(CodeFixApplierTest, FixesEveryDocumentWithDiagnostics) {
  const auto workspace = test::MakeWorkspace(
      {{{"a.cpp", "\tint a;\n"}, {"b.cpp", "int b;\n"}}, {{"c.cpp", "\t\tc"}}});
  Analyze(workspace, analyzer_);
  test::ReplacementFixer fixer("T1", " ");

  const auto fixed =
      applier_.Apply(workspace, result_, fixer, CancellationToken::None());

  EXPECT_EQ(" int a;\n", test::FindDocument(fixed, "a.cpp")->Text());
  EXPECT_EQ("  c", test::FindDocument(fixed, "c.cpp")->Text());
  EXPECT_EQ(test::FindDocument(workspace, "b.cpp"),
            test::FindDocument(fixed, "b.cpp"));
  EXPECT_EQ(2, fixer.calls.load());
  EXPECT_EQ("\tint a;\n", test::FindDocument(workspace, "a.cpp")->Text());
}

TEST_F(CodeFixApplierTest, IgnoresDiagnosticsTheFixerCannotHandle) {
  const auto workspace = test::MakeWorkspace({{{"a.cpp", "\tint a;"}}});
  Analyze(workspace, analyzer_);
  test::ReplacementFixer fixer("OTHER", " ");

  const auto fixed =
      applier_.Apply(workspace, result_, fixer, CancellationToken::None());

  EXPECT_EQ(0, fixer.calls.load());
  EXPECT_FALSE(fixed.HasChangesFrom(workspace));
}

TEST_F(CodeFixApplierTest, FailingDocumentKeepsItsContent) {
  const auto workspace = test::MakeWorkspace(
      {{{"d1.cpp", "\t1"}, {"d2.cpp", "\t2"}, {"d3.cpp", "\t3"}}});
  Analyze(workspace, analyzer_);
  test::ReplacementFixer fixer("T1", " ", {"d2.cpp"});

  const auto fixed =
      applier_.Apply(workspace, result_, fixer, CancellationToken::None());

  EXPECT_EQ(" 1", test::FindDocument(fixed, "d1.cpp")->Text());
  EXPECT_EQ("\t2", test::FindDocument(fixed, "d2.cpp")->Text());
  EXPECT_EQ(" 3", test::FindDocument(fixed, "d3.cpp")->Text());
  EXPECT_THAT(log_.str(), HasSubstr("level=warn message=\"fix.document.failed\""));
  EXPECT_THAT(log_.str(), HasSubstr("cannot fix d2.cpp"));
}

TEST_F(CodeFixApplierTest, OutOfRangeEditFailsOnlyThatDocument) {
  const auto workspace =
      test::MakeWorkspace({{{"a.cpp", "\ta"}, {"b.cpp", "\tb"}}});
  const auto a = test::FindDocument(workspace, "a.cpp");
  auto bad = MakeDiagnostic("T1", "tab", DiagnosticSeverity::kWarning, "bad",
                            *a, TextSpan{1, 40});
  result_.AddDiagnostic(0, bad);
  Analyze(workspace, analyzer_);
  test::ReplacementFixer fixer("T1", " ");

  const auto fixed =
      applier_.Apply(workspace, result_, fixer, CancellationToken::None());

  EXPECT_EQ("\ta", test::FindDocument(fixed, "a.cpp")->Text());
  EXPECT_EQ(" b", test::FindDocument(fixed, "b.cpp")->Text());
}

TEST_F(CodeFixApplierTest, LogsRejectedOverlappingEdits) {
  const auto workspace = test::MakeWorkspace({{{"a.cpp", "\tx"}}});
  const auto a = test::FindDocument(workspace, "a.cpp");
  result_.AddDiagnostic(0, MakeDiagnostic("T1", "tab",
                                          DiagnosticSeverity::kWarning, "wide",
                                          *a, TextSpan{0, 2}));
  Analyze(workspace, analyzer_);
  test::ReplacementFixer fixer("T1", "_");

  const auto fixed =
      applier_.Apply(workspace, result_, fixer, CancellationToken::None());

  EXPECT_EQ("_", test::FindDocument(fixed, "a.cpp")->Text());
  EXPECT_THAT(log_.str(), HasSubstr("fix.edit.rejected"));
}

TEST_F(CodeFixApplierTest, CancelledApplyLeavesSnapshotUntouched) {
  const auto workspace = test::MakeWorkspace({{{"a.cpp", "\ta"}}});
  Analyze(workspace, analyzer_);
  test::ReplacementFixer fixer("T1", " ");
  CancellationSource source;
  source.Cancel();

  const auto fixed = applier_.Apply(workspace, result_, fixer, source.Token());

  EXPECT_FALSE(fixed.HasChangesFrom(workspace));
  EXPECT_EQ(0, fixer.calls.load());
}

TEST_F(CodeFixApplierTest, CancellationKeepsDocumentsAlreadyFixed) {
  std::vector<test::DocumentSpec> documents;
  for (int i = 0; i < 8; ++i) {
    documents.push_back({"d" + std::to_string(i) + ".cpp", "\tx"});
  }
  const auto workspace = test::MakeWorkspace({documents});
  Analyze(workspace, analyzer_);
  CancellationSource source;
  CancellingFixer fixer(source);
  DefaultCodeFixApplier single_worker(logger_, 1);

  const auto fixed =
      single_worker.Apply(workspace, result_, fixer, source.Token());

  EXPECT_TRUE(source.IsCancellationRequested());
  EXPECT_EQ(1, fixer.calls.load());
  EXPECT_EQ(" x", test::FindDocument(fixed, "d0.cpp")->Text());
  EXPECT_THAT(fixed.GetChangedDocuments(workspace),
              ElementsAre(test::FindDocument(workspace, "d0.cpp")->Id()));
}

TEST_F(CodeFixApplierTest, DocumentsStartedBeforeCancellationAreAllKept) {
  std::vector<test::DocumentSpec> documents;
  for (int i = 0; i < 64; ++i) {
    documents.push_back({"d" + std::to_string(i) + ".cpp", "\tx"});
  }
  const auto workspace = test::MakeWorkspace({documents});
  Analyze(workspace, analyzer_);
  CancellationSource source;
  CancellingFixer fixer(source);
  DefaultCodeFixApplier applier(logger_, 4);

  const auto fixed = applier.Apply(workspace, result_, fixer, source.Token());

  const auto seen = fixer.Seen();
  ASSERT_FALSE(seen.empty());
  EXPECT_EQ(seen.size(), fixed.GetChangedDocuments(workspace).size());
  for (const auto &document : documents) {
    const auto expected = seen.count(document.path) != 0 ? " x" : "\tx";
    EXPECT_EQ(expected, test::FindDocument(fixed, document.path)->Text())
        << document.path;
  }
}

TEST_F(CodeFixApplierTest, FixesManyDocumentsOnFewThreads) {
  std::vector<test::DocumentSpec> documents;
  for (int i = 0; i < 500; ++i) {
    documents.push_back({"d" + std::to_string(i) + ".cpp", "\tx\n"});
  }
  const auto workspace = test::MakeWorkspace({documents});
  Analyze(workspace, analyzer_);
  test::ReplacementFixer fixer("T1", " ");
  DefaultCodeFixApplier applier(logger_, 3);

  const auto fixed =
      applier.Apply(workspace, result_, fixer, CancellationToken::None());

  EXPECT_EQ(500, fixer.calls.load());
  EXPECT_EQ(500u, fixed.GetChangedDocuments(workspace).size());
}

} // namespace
} // namespace stylefix
