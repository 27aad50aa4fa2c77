#include <stylefix/workspace.h>

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace stylefix {
namespace {

std::atomic<std::uint64_t> next_project_id{1};
std::atomic<std::uint64_t> next_document_id{1};

std::vector<std::size_t> ComputeLineStarts(const std::string &text) {
  std::vector<std::size_t> starts{0};
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
      ++i;
      starts.push_back(i + 1);
    } else if (text[i] == '\n' || text[i] == '\r') {
      starts.push_back(i + 1);
    }
  }
  return starts;
}

} // namespace

std::string EncodingName(TextEncoding encoding) {
  switch (encoding) {
  case TextEncoding::kUtf8:
    return "utf-8";
  case TextEncoding::kUtf8Bom:
    return "utf-8-bom";
  }
  return "utf-8";
}

ProjectId NewProjectId() { return ProjectId{next_project_id.fetch_add(1)}; }

DocumentId NewDocumentId(ProjectId project) {
  return DocumentId{project, next_document_id.fetch_add(1)};
}

Document::Document(DocumentId id, std::string name, std::string file_path,
                   std::string text, TextEncoding encoding)
    : id_(id), name_(std::move(name)), file_path_(std::move(file_path)),
      text_(std::move(text)), encoding_(encoding),
      line_starts_(ComputeLineStarts(text_)) {}

std::shared_ptr<const Document> Document::WithText(std::string text) const {
  return std::make_shared<const Document>(id_, name_, file_path_,
                                          std::move(text), encoding_);
}

LinePosition Document::GetLinePosition(std::size_t offset) const {
  offset = std::min(offset, text_.size());
  const auto next_line =
      std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const auto line =
      static_cast<std::size_t>(std::distance(line_starts_.begin(), next_line)) -
      1;
  return LinePosition{line, offset - line_starts_[line]};
}

FileLinePositionSpan Document::GetLineSpan(const TextSpan &span) const {
  return FileLinePositionSpan{file_path_, GetLinePosition(span.start),
                              GetLinePosition(span.End())};
}

std::size_t Document::LineStart(std::size_t line) const {
  if (line >= line_starts_.size()) {
    throw std::out_of_range("Line " + std::to_string(line) +
                            " is outside of " + file_path_);
  }
  return line_starts_[line];
}

// Offset of the first line break character of `line`, or the end of text.
std::size_t Document::LineEnd(std::size_t line) const {
  auto end = line + 1 < line_starts_.size() ? line_starts_[line + 1]
                                            : text_.size();
  const auto start = LineStart(line);
  while (end > start && (text_[end - 1] == '\n' || text_[end - 1] == '\r')) {
    --end;
  }
  return end;
}

Project::Project(ProjectId id, std::string name, std::string file_path,
                 std::string language,
                 std::vector<std::shared_ptr<const Document>> documents,
                 OptionSet options)
    : id_(id), name_(std::move(name)), file_path_(std::move(file_path)),
      language_(std::move(language)), documents_(std::move(documents)),
      options_(std::move(options)) {}

std::shared_ptr<const Document>
Project::GetDocument(const DocumentId &id) const {
  const auto found =
      std::find_if(documents_.begin(), documents_.end(),
                   [&](const auto &document) { return document->Id() == id; });
  return found == documents_.end() ? nullptr : *found;
}

std::shared_ptr<const Document>
Project::FindDocumentByPath(const std::string &path) const {
  const auto found = std::find_if(
      documents_.begin(), documents_.end(),
      [&](const auto &document) { return document->FilePath() == path; });
  return found == documents_.end() ? nullptr : *found;
}

std::shared_ptr<const Project> Project::WithDocuments(
    const std::vector<std::shared_ptr<const Document>> &updated) const {
  auto documents = documents_;
  for (auto &document : documents) {
    const auto replacement = std::find_if(
        updated.begin(), updated.end(),
        [&](const auto &candidate) { return candidate->Id() == document->Id(); });
    if (replacement != updated.end()) {
      document = *replacement;
    }
  }
  return std::make_shared<const Project>(id_, name_, file_path_, language_,
                                         std::move(documents), options_);
}

Workspace::Workspace(std::vector<std::shared_ptr<const Project>> projects)
    : projects_(std::move(projects)) {}

std::shared_ptr<const Project> Workspace::GetProject(const ProjectId &id) const {
  const auto found =
      std::find_if(projects_.begin(), projects_.end(),
                   [&](const auto &project) { return project->Id() == id; });
  return found == projects_.end() ? nullptr : *found;
}

std::shared_ptr<const Document>
Workspace::GetDocument(const DocumentId &id) const {
  const auto project = GetProject(id.project);
  return project ? project->GetDocument(id) : nullptr;
}

std::size_t Workspace::DocumentCount() const {
  std::size_t count = 0;
  for (const auto &project : projects_) {
    count += project->Documents().size();
  }
  return count;
}

Workspace Workspace::WithDocumentText(const DocumentId &id,
                                      std::string text) const {
  const auto document = GetDocument(id);
  if (!document) {
    throw std::invalid_argument("Document is not part of the workspace");
  }
  return WithDocuments({document->WithText(std::move(text))});
}

Workspace Workspace::WithDocuments(
    const std::vector<std::shared_ptr<const Document>> &updated) const {
  std::unordered_map<ProjectId, std::vector<std::shared_ptr<const Document>>>
      by_project;
  for (const auto &document : updated) {
    if (!GetDocument(document->Id())) {
      throw std::invalid_argument("Document " + document->FilePath() +
                                  " is not part of the workspace");
    }
    by_project[document->Id().project].push_back(document);
  }

  auto projects = projects_;
  for (auto &project : projects) {
    const auto found = by_project.find(project->Id());
    if (found != by_project.end()) {
      project = project->WithDocuments(found->second);
    }
  }
  return Workspace(std::move(projects));
}

std::vector<DocumentId>
Workspace::GetChangedDocuments(const Workspace &baseline) const {
  std::vector<DocumentId> changed;
  for (const auto &project : projects_) {
    for (const auto &document : project->Documents()) {
      const auto previous = baseline.GetDocument(document->Id());
      if (!previous) {
        changed.push_back(document->Id());
        continue;
      }
      if (previous != document && previous->Text() != document->Text()) {
        changed.push_back(document->Id());
      }
    }
  }
  return changed;
}

bool Workspace::HasChangesFrom(const Workspace &baseline) const {
  return !GetChangedDocuments(baseline).empty();
}

} // namespace stylefix
