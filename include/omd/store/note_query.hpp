#pragma once

#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "omd/common.hpp"
#include "omd/core/metadata_kind.hpp"
#include "omd/core/metadata_store.hpp"
#include "omd/core/note.hpp"

namespace omd::store {

// One has() condition a note must satisfy
struct MetadataPredicate {
  std::string key;
  std::optional<core::Values> values;  // absent: key only
  core::MetadataKind kind = core::MetadataKind::kAll;

  // Parses `key[=v1,v2][@kind]`. "key=" asks for the key with an empty
  // value list, which is the same as "key".
  static Result<MetadataPredicate> parse(std::string_view text,
                                         core::MetadataKind default_kind = core::MetadataKind::kAll);

  bool matches(const core::Note& note) const;
};

// Filters on file names and metadata; every set condition must hold
struct QueryOptions {
  std::optional<std::string> starts_with;
  std::optional<std::string> ends_with;
  std::optional<std::string> pattern;  // regex anchored at the start of the file name
  std::vector<MetadataPredicate> has_meta;
};

class NoteQuery {
 public:
  NoteQuery() = default;

  // Compiles the file name pattern; an invalid regex is kInvalidArgument
  static Result<NoteQuery> compile(QueryOptions options);

  bool matchesPath(const std::filesystem::path& path) const;
  bool matchesMetadata(const core::Note& note) const;
  bool matches(const core::Note& note) const {
    return matchesPath(note.path()) && matchesMetadata(note);
  }

  bool empty() const noexcept;
  const QueryOptions& options() const noexcept { return options_; }

 private:
  QueryOptions options_;
  std::optional<std::regex> pattern_;
};

}  // namespace omd::store
