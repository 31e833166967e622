#include "omd/store/note_query.hpp"

namespace omd::store {

Result<MetadataPredicate> MetadataPredicate::parse(std::string_view text,
                                                   core::MetadataKind default_kind) {
  MetadataPredicate predicate;
  predicate.kind = default_kind;

  auto at = text.rfind('@');
  if (at != std::string_view::npos) {
    auto kind = core::metadataKindFromString(text.substr(at + 1));
    if (!kind.has_value()) {
      return std::unexpected(kind.error());
    }
    predicate.kind = *kind;
    text = text.substr(0, at);
  }

  auto eq = text.find('=');
  auto key = text.substr(0, eq);
  if (eq != std::string_view::npos) {
    predicate.values = core::splitValues(text.substr(eq + 1));
  }

  auto first = key.find_first_not_of(" \t");
  auto last = key.find_last_not_of(" \t");
  if (first == std::string_view::npos) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Metadata condition has no key: '" + std::string(text) + "'"));
  }
  predicate.key = std::string(key.substr(first, last - first + 1));
  return predicate;
}

bool MetadataPredicate::matches(const core::Note& note) const {
  return note.has(key, values, kind);
}

Result<NoteQuery> NoteQuery::compile(QueryOptions options) {
  NoteQuery query;
  if (options.pattern.has_value()) {
    try {
      query.pattern_.emplace(*options.pattern);
    } catch (const std::regex_error& e) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "Invalid file name pattern '" + *options.pattern +
                                           "': " + e.what()));
    }
  }
  query.options_ = std::move(options);
  return query;
}

bool NoteQuery::matchesPath(const std::filesystem::path& path) const {
  auto name = path.filename().string();
  if (options_.starts_with && !name.starts_with(*options_.starts_with)) {
    return false;
  }
  if (options_.ends_with && !name.ends_with(*options_.ends_with)) {
    return false;
  }
  if (pattern_ &&
      !std::regex_search(name, *pattern_, std::regex_constants::match_continuous)) {
    return false;
  }
  return true;
}

bool NoteQuery::matchesMetadata(const core::Note& note) const {
  for (const auto& predicate : options_.has_meta) {
    if (!predicate.matches(note)) {
      return false;
    }
  }
  return true;
}

bool NoteQuery::empty() const noexcept {
  return !options_.starts_with && !options_.ends_with && !options_.pattern &&
         options_.has_meta.empty();
}

}  // namespace omd::store
