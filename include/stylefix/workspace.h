#pragma once

#include <stylefix/models.h>

#include <memory>
#include <string>
#include <vector>

namespace stylefix {

// Files are read and written as UTF-8; a leading byte order mark is
// remembered so saving puts it back.
enum class TextEncoding { kUtf8, kUtf8Bom };

std::string EncodingName(TextEncoding encoding);

ProjectId NewProjectId();
DocumentId NewDocumentId(ProjectId project);

class Document {
public:
  Document(DocumentId id, std::string name, std::string file_path,
           std::string text, TextEncoding encoding = TextEncoding::kUtf8);

  const DocumentId &Id() const { return id_; }
  const std::string &Name() const { return name_; }
  const std::string &FilePath() const { return file_path_; }
  const std::string &Text() const { return text_; }
  TextEncoding Encoding() const { return encoding_; }

  // Same identity and path, new content.
  std::shared_ptr<const Document> WithText(std::string text) const;

  LinePosition GetLinePosition(std::size_t offset) const;
  FileLinePositionSpan GetLineSpan(const TextSpan &span) const;
  std::size_t LineCount() const { return line_starts_.size(); }
  std::size_t LineStart(std::size_t line) const;
  std::size_t LineEnd(std::size_t line) const;

private:
  DocumentId id_;
  std::string name_;
  std::string file_path_;
  std::string text_;
  TextEncoding encoding_;
  std::vector<std::size_t> line_starts_;
};

class Project {
public:
  Project(ProjectId id, std::string name, std::string file_path,
          std::string language,
          std::vector<std::shared_ptr<const Document>> documents,
          OptionSet options = {});

  const ProjectId &Id() const { return id_; }
  const std::string &Name() const { return name_; }
  const std::string &FilePath() const { return file_path_; }
  const std::string &Language() const { return language_; }
  const OptionSet &Options() const { return options_; }
  const std::vector<std::shared_ptr<const Document>> &Documents() const {
    return documents_;
  }

  std::shared_ptr<const Document> GetDocument(const DocumentId &id) const;
  std::shared_ptr<const Document>
  FindDocumentByPath(const std::string &path) const;

  // Replaces documents with matching identities; the rest are shared.
  std::shared_ptr<const Project> WithDocuments(
      const std::vector<std::shared_ptr<const Document>> &updated) const;

private:
  ProjectId id_;
  std::string name_;
  std::string file_path_;
  std::string language_;
  std::vector<std::shared_ptr<const Document>> documents_;
  OptionSet options_;
};

// Immutable snapshot. Every edit yields a new Workspace that shares all
// untouched projects and documents with its predecessor.
class Workspace {
public:
  Workspace() = default;
  explicit Workspace(std::vector<std::shared_ptr<const Project>> projects);

  const std::vector<std::shared_ptr<const Project>> &Projects() const {
    return projects_;
  }
  std::shared_ptr<const Project> GetProject(const ProjectId &id) const;
  std::shared_ptr<const Document> GetDocument(const DocumentId &id) const;
  std::size_t DocumentCount() const;

  Workspace WithDocumentText(const DocumentId &id, std::string text) const;
  Workspace WithDocuments(
      const std::vector<std::shared_ptr<const Document>> &updated) const;

  // Documents of this snapshot whose text differs from `baseline`.
  std::vector<DocumentId> GetChangedDocuments(const Workspace &baseline) const;
  bool HasChangesFrom(const Workspace &baseline) const;

private:
  std::vector<std::shared_ptr<const Project>> projects_;
};

} // namespace stylefix
