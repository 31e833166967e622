#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "omd/common.hpp"
#include "omd/core/content_composer.hpp"
#include "omd/core/note_metadata.hpp"
#include "omd/core/note_segments.hpp"

namespace omd::core {

// Lifecycle of a note. Mutations move a parsed note to kDirty,
// updateContent() returns it to kClean, a successful write to kPersisted.
enum class NoteState {
  kUnparsed,
  kClean,
  kDirty,
  kPersisted
};

std::string_view noteStateToString(NoteState state) noexcept;

// Separator rules applied to each metadata kind at parse time
struct ParseOptions {
  SeparatorRules frontmatter_separators;
  SeparatorRules inline_separators;
};

// A note file: original text, both metadata stores, and the segments
// the composed text is rebuilt from
class Note {
 public:
  explicit Note(std::string raw_text, std::filesystem::path path = {});

  // Populates the stores and segments. A malformed header still leaves a
  // usable note (empty frontmatter store, block kept verbatim in the body)
  // and is reported as ErrorCode::kInvalidFrontmatter.
  Result<void> parse(const ParseOptions& options = {});

  // Getters
  NoteState state() const noexcept { return state_; }
  const std::filesystem::path& path() const noexcept { return path_; }
  const std::string& rawText() const noexcept { return raw_text_; }
  const std::string& content() const noexcept { return content_; }
  const NoteMetadata& metadata() const noexcept { return metadata_; }
  const NoteSegments& segments() const noexcept { return segments_; }
  const std::optional<Error>& frontmatterError() const noexcept { return frontmatter_error_; }

  // Metadata mutations
  Result<void> add(const std::string& key, const std::optional<Values>& values,
                   MetadataKind kind, bool overwrite = false);
  Result<void> remove(const std::string& key, const std::optional<Values>& values,
                      MetadataKind kind);
  Result<void> removeEmpty(MetadataKind kind);
  Result<void> move(const std::vector<std::string>& keys, MetadataKind from, MetadataKind to);
  Result<void> moveToDefaults(const FieldDefaults& defaults);
  Result<void> removeDuplicateValues(const std::vector<std::string>& keys, MetadataKind kind);
  Result<void> orderValues(const std::vector<std::string>& keys, Order order, MetadataKind kind);
  Result<void> orderKeys(Order order, MetadataKind kind);
  Result<void> order(const std::vector<std::string>& keys, std::optional<Order> key_order,
                     std::optional<Order> value_order, MetadataKind kind);

  // Body edits. Field lines an edit adds, changes or deletes update the
  // inline store to match.
  Result<void> append(const std::string& text, bool allow_repeat = false);
  Result<void> sub(const std::string& pattern, const std::string& replacement,
                   bool is_regex = false);

  // Queries
  bool has(const std::string& key, const std::optional<Values>& values,
           MetadataKind kind) const;
  std::optional<Values> get(const std::string& key, MetadataKind kind) const;

  // Recomposes the text from the current stores. Clean or persisted notes
  // return the cached text unchanged.
  Result<std::string> updateContent(const ComposeOptions& options = {});

  // Called by the writer once the cached text reached storage
  Result<void> markPersisted();

 private:
  std::filesystem::path path_;
  std::string raw_text_;
  std::string content_;
  NoteState state_ = NoteState::kUnparsed;
  NoteMetadata metadata_;
  NoteSegments segments_;
  std::optional<Error> frontmatter_error_;
  ParseOptions parse_options_;

  Result<void> checkParsed() const;

  template <typename Fn>
  Result<void> mutate(Fn&& fn) {
    auto parsed = checkParsed();
    if (!parsed.has_value()) {
      return parsed;
    }
    fn();
    state_ = NoteState::kDirty;
    return {};
  }

  void setBody(std::string body);
};

}  // namespace omd::core
