#pragma once

#include <optional>
#include <string>
#include <vector>

#include "omd/core/inline_metadata.hpp"

namespace omd::core {

// A parsed note split into the parts the composer works from
struct NoteSegments {
  std::string preamble;                         // bytes before the header (UTF-8 BOM)
  std::optional<std::string> frontmatter_block; // raw header text, kept verbatim even when malformed
  bool frontmatter_valid = false;
  std::string body;                             // text below a valid header; the whole text otherwise
  std::vector<InlineField> inline_fields;       // field lines of `body`
  SeparatorRules inline_separators;             // applied when the fields were parsed

  // Re-tracks inline field positions after the body changed
  void reindex() { inline_fields = InlineMetadata::scan(body); }
};

}  // namespace omd::core
