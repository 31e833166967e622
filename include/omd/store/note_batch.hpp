#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "omd/common.hpp"
#include "omd/core/content_composer.hpp"
#include "omd/core/note.hpp"
#include "omd/store/note_query.hpp"
#include "omd/store/note_store.hpp"

namespace omd::store {

struct BatchFailure {
  std::filesystem::path path;
  std::string operation;
  Error error;
};

struct BatchReport {
  size_t processed = 0;
  std::vector<std::filesystem::path> changed;   // composed text differs from the file
  std::vector<std::filesystem::path> written;   // empty on a dry run
  std::vector<BatchFailure> failures;

  bool ok() const noexcept { return failures.empty(); }
};

// A working set of notes. A failure on one note (unreadable file, broken
// header, failed mutation or write) drops that note from the set and is
// recorded; the remaining notes are still processed.
class NoteBatch {
 public:
  explicit NoteBatch(NoteStore& store, core::ParseOptions parse_options = {});

  // Adds every note under `roots`. Fails only when the roots themselves
  // cannot be listed.
  Result<void> load(const std::vector<std::filesystem::path>& roots, bool recursive = true);

  // Keeps the notes matching the query
  void filter(const NoteQuery& query);

  // Runs `fn` on every note; notes it fails on leave the set
  void apply(std::string_view operation, const std::function<Result<void>(core::Note&)>& fn);

  // Recomposes every note and writes those whose text changed
  BatchReport commit(const core::ComposeOptions& options, bool dry_run = false);

  std::vector<core::Note>& notes() noexcept { return notes_; }
  const std::vector<core::Note>& notes() const noexcept { return notes_; }
  const std::vector<BatchFailure>& failures() const noexcept { return failures_; }
  size_t size() const noexcept { return notes_.size(); }

 private:
  NoteStore& store_;
  core::ParseOptions parse_options_;
  std::vector<core::Note> notes_;
  std::vector<BatchFailure> failures_;

  void recordFailure(const std::filesystem::path& path, std::string_view operation,
                     const Error& error);
};

}  // namespace omd::store
