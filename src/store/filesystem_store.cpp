#include "omd/store/filesystem_store.hpp"

#include <algorithm>

#include "omd/util/filesystem.hpp"

namespace omd::store {

FilesystemStore::FilesystemStore(Config config) : config_(std::move(config)) {}

Result<std::vector<std::filesystem::path>> FilesystemStore::list(
    const std::vector<std::filesystem::path>& roots, bool recursive) {
  std::vector<std::filesystem::path> paths;

  for (const auto& root : roots) {
    std::error_code ec;
    if (std::filesystem::is_directory(root, ec)) {
      auto listed = util::FileSystem::listDirectory(root, config_.extension, recursive);
      if (!listed.has_value()) {
        return std::unexpected(listed.error());
      }
      paths.insert(paths.end(), listed->begin(), listed->end());
    } else if (std::filesystem::is_regular_file(root, ec)) {
      paths.push_back(root);
    } else {
      return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                       "File or directory does not exist: " + root.string()));
    }
  }

  std::sort(paths.begin(), paths.end());
  paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
  return paths;
}

Result<core::Note> FilesystemStore::load(const std::filesystem::path& path,
                                         const core::ParseOptions& options) {
  auto content_result = util::FileSystem::readFile(path);
  if (!content_result.has_value()) {
    return std::unexpected(content_result.error());
  }

  core::Note note(std::move(*content_result), path);
  auto parsed = note.parse(options);
  if (!parsed.has_value()) {
    return std::unexpected(parsed.error());
  }
  return note;
}

Result<void> FilesystemStore::store(core::Note& note) {
  if (note.state() == core::NoteState::kUnparsed || note.state() == core::NoteState::kDirty) {
    return std::unexpected(makeError(
        ErrorCode::kInvalidState,
        "Cannot write " + note.path().string() + " before it is recomposed (state: " +
            std::string(core::noteStateToString(note.state())) + ")"));
  }
  if (note.path().empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Note has no file path"));
  }

  auto write_result = util::FileSystem::writeFileAtomic(note.path(), note.content());
  if (!write_result.has_value()) {
    return write_result;
  }
  return note.markPersisted();
}

}  // namespace omd::store
