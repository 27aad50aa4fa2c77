#include <stylefix/folder_workspace_loader.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>

namespace stylefix {

namespace {

constexpr const char kUtf8Bom[] = "\xEF\xBB\xBF";

struct LanguageLoader {
  std::string language;
  std::string project_name;
  std::set<std::string> extensions;
};

const std::vector<LanguageLoader> &LanguageLoaders() {
  static const std::vector<LanguageLoader> kLoaders = {
      {"C", "c", {".c", ".h"}},
      {"C++", "cpp", {".cc", ".cpp", ".cxx", ".hh", ".hpp", ".hxx", ".ixx",
                      ".inl"}}};
  return kLoaders;
}

std::set<std::string> DefaultExtensions() {
  std::set<std::string> extensions;
  for (const auto &loader : LanguageLoaders()) {
    extensions.insert(loader.extensions.begin(), loader.extensions.end());
  }
  return extensions;
}

std::set<std::string> NormalizeExtensions(const std::vector<std::string> &raw) {
  if (raw.empty()) {
    return DefaultExtensions();
  }
  std::set<std::string> extensions;
  for (auto extension : raw) {
    if (extension.empty()) {
      continue;
    }
    if (extension.front() != '.') {
      extension.insert(extension.begin(), '.');
    }
    extensions.insert(std::move(extension));
  }
  return extensions;
}

// Languages not claiming an extension land in a catch-all project.
const LanguageLoader &LoaderFor(const std::filesystem::path &path) {
  static const LanguageLoader kOther{"Text", "other", {}};
  const auto extension = path.extension().string();
  for (const auto &loader : LanguageLoaders()) {
    if (loader.extensions.count(extension) != 0) {
      return loader;
    }
  }
  return kOther;
}

bool IsWithin(const std::filesystem::path &candidate,
              const std::filesystem::path &potential_parent) {
  if (potential_parent.empty()) {
    return false;
  }

  const auto parent = std::filesystem::weakly_canonical(potential_parent);
  const auto normalized_candidate =
      std::filesystem::weakly_canonical(candidate);

  return std::distance(parent.begin(), parent.end()) <=
             std::distance(normalized_candidate.begin(),
                           normalized_candidate.end()) &&
         std::equal(parent.begin(), parent.end(), normalized_candidate.begin());
}

bool IsIgnoredPath(const std::filesystem::path &path,
                   const std::vector<std::filesystem::path> &ignored_paths) {
  return std::any_of(
      ignored_paths.begin(), ignored_paths.end(),
      [&](const auto &ignored) { return IsWithin(path, ignored); });
}

std::filesystem::path ResolveRootPath(const std::filesystem::path &root) {
  if (root.empty()) {
    throw std::invalid_argument("Workspace root must not be empty.");
  }

  const auto normalized_root = std::filesystem::weakly_canonical(root);
  if (!std::filesystem::exists(normalized_root) ||
      !std::filesystem::is_directory(normalized_root)) {
    throw std::runtime_error("Workspace root is not a directory: " +
                             normalized_root.string());
  }
  return normalized_root;
}

std::vector<std::filesystem::path>
AbsoluteIgnoredPaths(const std::filesystem::path &root,
                     const std::vector<std::filesystem::path> &ignored) {
  std::vector<std::filesystem::path> paths;
  paths.reserve(ignored.size());
  for (const auto &path : ignored) {
    paths.push_back(std::filesystem::weakly_canonical(
        path.is_absolute() ? path : root / path));
  }
  return paths;
}

std::vector<std::filesystem::path>
CollectFiles(const std::filesystem::path &root,
             const std::set<std::string> &extensions,
             const std::vector<std::filesystem::path> &ignored_paths) {
  std::vector<std::filesystem::path> files;
  for (std::filesystem::recursive_directory_iterator it(root), end; it != end;
       ++it) {
    const auto &entry = *it;
    const auto canonical_path = std::filesystem::weakly_canonical(entry.path());
    if (IsIgnoredPath(canonical_path, ignored_paths)) {
      if (entry.is_directory()) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (entry.is_regular_file() &&
        extensions.count(canonical_path.extension().string()) != 0) {
      files.push_back(canonical_path);
    }
  }
  return files;
}

std::vector<std::filesystem::path>
SelectIncludedFiles(const std::filesystem::path &root,
                    const std::vector<std::filesystem::path> &files_to_include,
                    const std::set<std::string> &extensions,
                    const std::vector<std::filesystem::path> &ignored_paths) {
  std::vector<std::filesystem::path> files;
  for (const auto &file : files_to_include) {
    const auto path = std::filesystem::weakly_canonical(
        file.is_absolute() ? file : root / file);
    if (std::filesystem::is_regular_file(path) &&
        extensions.count(path.extension().string()) != 0 &&
        !IsIgnoredPath(path, ignored_paths)) {
      files.push_back(path);
    }
  }
  return files;
}

std::string ReadFileBytes(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw std::runtime_error("Failed to open source file: " + path.string());
  }
  return std::string(std::istreambuf_iterator<char>(stream),
                     std::istreambuf_iterator<char>());
}

} // namespace

DecodedText DecodeFileContent(const std::string &bytes) {
  if (bytes.rfind(kUtf8Bom, 0) == 0) {
    return DecodedText{bytes.substr(3), TextEncoding::kUtf8Bom};
  }
  if (bytes.size() >= 2 &&
      ((bytes[0] == '\xFF' && bytes[1] == '\xFE') ||
       (bytes[0] == '\xFE' && bytes[1] == '\xFF'))) {
    throw std::runtime_error("UTF-16 content is not supported");
  }
  return DecodedText{bytes, TextEncoding::kUtf8};
}

std::string EncodeFileContent(const std::string &text, TextEncoding encoding) {
  if (encoding == TextEncoding::kUtf8Bom) {
    return std::string(kUtf8Bom) + text;
  }
  return text;
}

FolderWorkspaceLoader::FolderWorkspaceLoader(FolderWorkspaceOptions options,
                                             std::shared_ptr<Logger> logger)
    : options_(std::move(options)), logger_(EnsureLogger(std::move(logger))) {}

Workspace FolderWorkspaceLoader::Load(
    const std::filesystem::path &root,
    const std::vector<std::filesystem::path> &files_to_include) {
  const auto resolved_root = ResolveRootPath(root);
  const auto extensions = NormalizeExtensions(options_.extensions);
  const auto ignored_paths =
      AbsoluteIgnoredPaths(resolved_root, options_.ignored_paths);

  auto files = files_to_include.empty()
                   ? CollectFiles(resolved_root, extensions, ignored_paths)
                   : SelectIncludedFiles(resolved_root, files_to_include,
                                         extensions, ignored_paths);
  std::sort(files.begin(), files.end());
  files.erase(std::unique(files.begin(), files.end()), files.end());

  // Grouped by project name so that project order is stable.
  std::map<std::string, std::vector<std::filesystem::path>> by_project;
  for (const auto &file : files) {
    by_project[LoaderFor(file).project_name].push_back(file);
  }

  std::vector<std::shared_ptr<const Project>> projects;
  for (const auto &[project_name, project_files] : by_project) {
    const auto &loader = LoaderFor(project_files.front());
    const auto project_id = NewProjectId();
    std::vector<std::shared_ptr<const Document>> documents;
    for (const auto &file : project_files) {
      try {
        auto decoded = DecodeFileContent(ReadFileBytes(file));
        documents.push_back(std::make_shared<const Document>(
            NewDocumentId(project_id), file.filename().string(), file.string(),
            std::move(decoded.text), decoded.encoding));
      } catch (const std::runtime_error &error) {
        logger_->Log(LogLevel::kWarn, "workspace.document.skipped",
                     {{"path", file.string()}, {"error", error.what()}});
      }
    }
    if (documents.empty()) {
      continue;
    }
    projects.push_back(std::make_shared<const Project>(
        project_id, project_name, resolved_root.string(), loader.language,
        std::move(documents)));
  }

  Workspace workspace(std::move(projects));
  logger_->Log(LogLevel::kInfo, "workspace.loaded",
               {{"root", resolved_root.string()},
                {"projects", std::to_string(workspace.Projects().size())},
                {"documents", std::to_string(workspace.DocumentCount())}});
  return workspace;
}

std::vector<FormattableDocument> FormattableDocuments(const Workspace &workspace) {
  std::vector<FormattableDocument> documents;
  for (const auto &project : workspace.Projects()) {
    for (const auto &document : project->Documents()) {
      documents.push_back(FormattableDocument{document->Id(),
                                              document->FilePath()});
    }
  }
  return documents;
}

std::vector<std::filesystem::path>
SaveChangedDocuments(const Workspace &original, const Workspace &updated,
                     Logger &logger) {
  std::vector<std::filesystem::path> written;
  for (const auto &id : updated.GetChangedDocuments(original)) {
    const auto document = updated.GetDocument(id);
    std::ofstream stream(document->FilePath(),
                         std::ios::binary | std::ios::trunc);
    if (!stream) {
      throw std::runtime_error("Failed to write formatted file: " +
                               document->FilePath());
    }
    stream << EncodeFileContent(document->Text(), document->Encoding());
    written.emplace_back(document->FilePath());
    logger.Log(LogLevel::kInfo, "workspace.document.saved",
               {{"path", document->FilePath()},
                {"encoding", EncodingName(document->Encoding())}});
  }
  return written;
}

} // namespace stylefix
