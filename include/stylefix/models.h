#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stylefix {

struct ProjectId {
  std::uint64_t value = 0;

  bool operator==(const ProjectId &other) const { return value == other.value; }
  bool operator!=(const ProjectId &other) const { return value != other.value; }
  bool operator<(const ProjectId &other) const { return value < other.value; }
};

// Stable across snapshots; never derived from document content.
struct DocumentId {
  ProjectId project;
  std::uint64_t value = 0;

  bool operator==(const DocumentId &other) const {
    return project == other.project && value == other.value;
  }
  bool operator!=(const DocumentId &other) const { return !(*this == other); }
  bool operator<(const DocumentId &other) const {
    if (project != other.project) {
      return project < other.project;
    }
    return value < other.value;
  }
};

struct TextSpan {
  std::size_t start = 0;
  std::size_t length = 0;

  std::size_t End() const { return start + length; }
  bool OverlapsWith(const TextSpan &other) const;

  bool operator==(const TextSpan &other) const {
    return start == other.start && length == other.length;
  }
};

// Zero-based.
struct LinePosition {
  std::size_t line = 0;
  std::size_t character = 0;

  bool operator==(const LinePosition &other) const {
    return line == other.line && character == other.character;
  }
  bool operator<(const LinePosition &other) const {
    if (line != other.line) {
      return line < other.line;
    }
    return character < other.character;
  }
};

struct FileLinePositionSpan {
  std::string path;
  LinePosition start;
  LinePosition end;

  bool operator==(const FileLinePositionSpan &other) const {
    return path == other.path && start == other.start && end == other.end;
  }
};

struct Location {
  std::string file_path;
  TextSpan span;
  FileLinePositionSpan line_span;
  std::optional<FileLinePositionSpan> mapped_line_span;

  // The span reported to users: remapped through generated-file mapping
  // when the analyzer supplied one.
  const FileLinePositionSpan &GetMappedLineSpan() const {
    return mapped_line_span ? *mapped_line_span : line_span;
  }

  bool operator==(const Location &other) const {
    return file_path == other.file_path && span == other.span &&
           line_span == other.line_span &&
           mapped_line_span == other.mapped_line_span;
  }
};

enum class DiagnosticSeverity { kHidden, kInfo, kWarning, kError };

struct Diagnostic {
  std::string id;
  std::string analyzer;
  DiagnosticSeverity severity = DiagnosticSeverity::kWarning;
  std::string message;
  DocumentId document;
  Location location;

  bool operator==(const Diagnostic &other) const {
    return id == other.id && analyzer == other.analyzer &&
           severity == other.severity && message == other.message &&
           document == other.document && location == other.location;
  }
};

struct TextEdit {
  TextSpan span;
  std::string new_text;
};

// Per-project analyzer configuration, consumed read-only.
class OptionSet {
public:
  OptionSet() = default;
  explicit OptionSet(std::map<std::string, std::string> values)
      : values_(std::move(values)) {}

  std::optional<std::string> Get(const std::string &key) const;
  std::string GetOr(const std::string &key, const std::string &fallback) const;
  bool GetBool(const std::string &key, bool fallback) const;
  int GetInt(const std::string &key, int fallback) const;

  OptionSet WithValue(const std::string &key, std::string value) const;
  // Values of `overrides` win over values already present.
  OptionSet MergedWith(const OptionSet &overrides) const;

  const std::map<std::string, std::string> &Values() const { return values_; }
  bool Empty() const { return values_.empty(); }

private:
  std::map<std::string, std::string> values_;
};

struct FormattableDocument {
  DocumentId id;
  std::string file_path;
};

struct FormatOptions {
  // Folder all reported paths are made relative to.
  std::string workspace_folder;
  bool save_formatted_files = false;
  bool changes_are_errors = false;
};

} // namespace stylefix

namespace std {

template <> struct hash<stylefix::ProjectId> {
  std::size_t operator()(const stylefix::ProjectId &id) const noexcept {
    return std::hash<std::uint64_t>()(id.value);
  }
};

template <> struct hash<stylefix::DocumentId> {
  std::size_t operator()(const stylefix::DocumentId &id) const noexcept {
    const auto project = std::hash<std::uint64_t>()(id.project.value);
    const auto document = std::hash<std::uint64_t>()(id.value);
    return project ^ (document + 0x9e3779b97f4a7c15ULL + (project << 6) +
                      (project >> 2));
  }
};

} // namespace std
