#pragma once

#include <stylefix/interfaces.h>
#include <stylefix/logging.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace stylefix {

// An analyzer failed while analyzing one project.
class ProjectAnalysisError : public std::runtime_error {
public:
  ProjectAnalysisError(std::string project, std::string analyzer,
                       const std::string &reason);

  const std::string &Project() const { return project_; }
  const std::string &AnalyzerName() const { return analyzer_; }

private:
  std::string project_;
  std::string analyzer_;
};

class CodeAnalysisRunner : public AnalyzerRunner {
public:
  explicit CodeAnalysisRunner(std::shared_ptr<Logger> logger = nullptr);

  // Runs the batch in order against `project`. Findings are buffered and
  // merged into `result` only once every analyzer of the batch finished, so
  // a failing or cancelled project contributes nothing.
  void Run(AnalysisResult &result,
           const std::vector<std::shared_ptr<Analyzer>> &analyzers,
           const Project &project, const OptionSet &options,
           const std::vector<std::string> &restrict_to_paths,
           const CancellationToken &token) override;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace stylefix
