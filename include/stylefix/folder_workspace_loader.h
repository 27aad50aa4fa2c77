#pragma once

#include <stylefix/interfaces.h>
#include <stylefix/logging.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace stylefix {

struct FolderWorkspaceOptions {
  // Empty keeps the default C and C++ extensions.
  std::vector<std::string> extensions;
  std::vector<std::filesystem::path> ignored_paths;
};

struct DecodedText {
  std::string text;
  TextEncoding encoding = TextEncoding::kUtf8;
};

// Strips a UTF-8 byte order mark. UTF-16 content is rejected with
// std::runtime_error.
DecodedText DecodeFileContent(const std::string &bytes);
std::string EncodeFileContent(const std::string &text, TextEncoding encoding);

// Loads one project per language found under the root folder.
class FolderWorkspaceLoader : public WorkspaceLoader {
public:
  explicit FolderWorkspaceLoader(FolderWorkspaceOptions options = {},
                                 std::shared_ptr<Logger> logger = nullptr);

  // With a non-empty `files_to_include`, only those files are loaded (when
  // they exist and carry a known extension); otherwise the whole tree is.
  Workspace
  Load(const std::filesystem::path &root,
       const std::vector<std::filesystem::path> &files_to_include) override;

private:
  FolderWorkspaceOptions options_;
  std::shared_ptr<Logger> logger_;
};

std::vector<FormattableDocument> FormattableDocuments(const Workspace &workspace);

// Writes every document of `updated` whose text differs from `original`.
std::vector<std::filesystem::path>
SaveChangedDocuments(const Workspace &original, const Workspace &updated,
                     Logger &logger);

} // namespace stylefix
