#include "omd/store/note_batch.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "omd/util/error_handler.hpp"

namespace omd::store {

NoteBatch::NoteBatch(NoteStore& store, core::ParseOptions parse_options)
    : store_(store), parse_options_(std::move(parse_options)) {}

Result<void> NoteBatch::load(const std::vector<std::filesystem::path>& roots, bool recursive) {
  auto paths = store_.list(roots, recursive);
  if (!paths.has_value()) {
    return std::unexpected(paths.error());
  }

  notes_.reserve(notes_.size() + paths->size());
  for (const auto& path : *paths) {
    auto note = store_.load(path, parse_options_);
    if (!note.has_value()) {
      recordFailure(path, "load", note.error());
      continue;
    }
    notes_.push_back(std::move(*note));
  }
  spdlog::debug("Loaded {} notes ({} failed)", notes_.size(), failures_.size());
  return {};
}

void NoteBatch::filter(const NoteQuery& query) {
  if (query.empty()) {
    return;
  }
  std::erase_if(notes_, [&](const core::Note& note) { return !query.matches(note); });
}

void NoteBatch::apply(std::string_view operation,
                      const std::function<Result<void>(core::Note&)>& fn) {
  std::vector<core::Note> kept;
  kept.reserve(notes_.size());
  for (auto& note : notes_) {
    auto result = fn(note);
    if (!result.has_value()) {
      recordFailure(note.path(), operation, result.error());
      continue;
    }
    kept.push_back(std::move(note));
  }
  notes_ = std::move(kept);
}

BatchReport NoteBatch::commit(const core::ComposeOptions& options, bool dry_run) {
  BatchReport report;

  for (auto& note : notes_) {
    ++report.processed;
    auto content = note.updateContent(options);
    if (!content.has_value()) {
      recordFailure(note.path(), "compose", content.error());
      continue;
    }
    if (*content == note.rawText()) {
      continue;
    }
    report.changed.push_back(note.path());
    if (dry_run) {
      continue;
    }

    auto stored = store_.store(note);
    if (!stored.has_value()) {
      recordFailure(note.path(), "write", stored.error());
      continue;
    }
    spdlog::debug("Wrote {}", note.path().string());
    report.written.push_back(note.path());
  }

  report.failures = failures_;
  return report;
}

void NoteBatch::recordFailure(const std::filesystem::path& path, std::string_view operation,
                              const Error& error) {
  auto context = util::ErrorContext{}.withFile(path.string()).withOperation(std::string(operation));
  util::ErrorHandler::instance().report(
      util::ContextualError(error, context, util::ErrorSeverity::kWarning));
  failures_.push_back(BatchFailure{path, std::string(operation), error});
}

}  // namespace omd::store
