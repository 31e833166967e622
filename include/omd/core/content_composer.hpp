#pragma once

#include <string>
#include <string_view>

#include "omd/common.hpp"
#include "omd/core/inline_metadata.hpp"
#include "omd/core/note_metadata.hpp"
#include "omd/core/note_segments.hpp"

namespace omd::core {

// Where a fresh inline block goes
enum class InlinePosition {
  kTop,     // directly below the frontmatter
  kBottom   // at the end of the note
};

std::string_view inlinePositionToString(InlinePosition position) noexcept;
Result<InlinePosition> inlinePositionFromString(std::string_view str);

struct ComposeOptions {
  InlinePosition inline_position = InlinePosition::kBottom;
  InlineTemplate inline_template = InlineTemplate::kStandard;
  bool inline_inplace = true;  // rewrite existing field lines where they are
};

// Rebuilds note text from the current stores and the original body
class ContentComposer {
 public:
  ContentComposer() = default;
  explicit ContentComposer(ComposeOptions options) : options_(options) {}

  const ComposeOptions& options() const noexcept { return options_; }

  // Reserialized frontmatter followed by the body with its inline fields
  // brought up to date
  std::string compose(const NoteMetadata& metadata, const NoteSegments& segments) const;

  std::string composeBody(const MetadataStore& inline_fields, const NoteSegments& segments) const;

 private:
  ComposeOptions options_;

  // Rewrites tracked field lines; fills `written` with the keys kept in place
  std::string rewriteInPlace(const MetadataStore& inline_fields, const NoteSegments& segments,
                             std::vector<std::string>& written) const;

  std::string insertBlock(const std::string& body, const std::string& block) const;
};

}  // namespace omd::core
