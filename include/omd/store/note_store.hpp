#pragma once

#include <filesystem>
#include <vector>

#include "omd/common.hpp"
#include "omd/core/note.hpp"

namespace omd::store {

// Abstract interface for note storage
class NoteStore {
 public:
  virtual ~NoteStore() = default;

  // Note files named by `roots`: files are taken as given, directories are
  // scanned (recursively when requested). Result is sorted and unique.
  virtual Result<std::vector<std::filesystem::path>> list(
      const std::vector<std::filesystem::path>& roots, bool recursive = true) = 0;

  // Reads and parses a note. A note whose header is malformed is reported
  // as ErrorCode::kInvalidFrontmatter and not returned.
  virtual Result<core::Note> load(const std::filesystem::path& path,
                                  const core::ParseOptions& options = {}) = 0;

  // Persists the composed text of a recomposed note and marks it persisted.
  // A dirty note is ErrorCode::kInvalidState.
  virtual Result<void> store(core::Note& note) = 0;
};

}  // namespace omd::store
